#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <rfl/json.hpp>
#include "../src/app/TrajectoryReader.hpp"
#include "../src/shared/Error.hpp"

// Prints the shape of a trajectory file as JSON:
// {"frameCount":..,"dimension":..,"dtype":"<f8","arrays":[..],"poseField":".."}

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            std::cerr << "Usage: " << argv[0] << " <trajectory.npy|.npz> [pose field]\n";
            return 1;
        }

        std::filesystem::path inputPath = argv[1];
        auto poseFields = motionlib::kDefaultPoseFields;
        if (argc >= 3) {
            poseFields = {argv[2]};
        }

        const motionlib::TrajectoryReader reader(poseFields);
        auto info = reader.inspect(inputPath);
        if (!info) {
            std::cerr << motionlib::ErrorKindName(info.error().kind) << ": " << info.error().message << "\n";
            return 1;
        }

        std::cout << rfl::json::write(*info, rfl::json::pretty) << "\n";
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
