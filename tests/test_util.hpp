#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <filesystem>
#include <string>

namespace celestiada {
namespace test {

// Fresh directory under the system temp dir, removed on destruction
struct TempDirectory {
    TempDirectory() {
        boost::uuids::random_generator generator;
        path = std::filesystem::temp_directory_path() /
               ("celestiada-test-" + boost::uuids::to_string(generator()));
        std::filesystem::create_directories(path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string str() const { return path.string(); }

    std::filesystem::path path;
};

} // namespace test
} // namespace celestiada
