//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_TEST_PROJECT_HPP
#define DEPSIEVE_TEST_PROJECT_HPP

/**
 * @file test_project.hpp
 * @brief Throwaway project trees for file system tests.
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace dsv::fixtures {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * A unique directory under the system temp dir, removed on destruction.
     */
    class TempProject {
    public:
        TempProject() {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string label = info ? std::string(info->test_suite_name()) + "_" + info->name() : "fixture";
            for (auto& c : label) {
                if (c == '/') c = '_';
            }
            std::random_device rd;
            root_ = fs::temp_directory_path() / ("depsieve_" + label + "_" + std::to_string(rd()));
            fs::create_directories(root_);
        }

        ~TempProject() {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        TempProject(const TempProject&) = delete;
        TempProject& operator=(const TempProject&) = delete;

        [[nodiscard]] const fs::path& root() const noexcept { return root_; }

        [[nodiscard]] fs::path path(const std::string& relative) const { return root_ / relative; }

        fs::path write(const std::string& relative, const std::string& content) const {
            const fs::path target = root_ / relative;
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary);
            out << content;
            return target;
        }

        fs::path write_json(const std::string& relative, const json& content) const {
            return write(relative, content.dump(2));
        }

        /**
         * Writes package.json with the given sections.
         */
        fs::path manifest(const json& dependencies, const json& dev_dependencies = json::object(),
                          const json& extra = json::object()) const {
            json doc = {{"name", "fixture"}, {"version", "1.0.0"}};
            if (!dependencies.empty()) doc["dependencies"] = dependencies;
            if (!dev_dependencies.empty()) doc["devDependencies"] = dev_dependencies;
            for (const auto& [key, value] : extra.items()) {
                doc[key] = value;
            }
            return write_json("package.json", doc);
        }

        /**
         * Creates node_modules/<name>/package.json requiring @p requirements.
         */
        fs::path install(const std::string& name, const json& requirements = json::object(),
                         const json& peers = json::object()) const {
            json doc = {{"name", name}, {"version", "1.0.0"}};
            if (!requirements.empty()) doc["dependencies"] = requirements;
            if (!peers.empty()) doc["peerDependencies"] = peers;
            return write_json("node_modules/" + name + "/package.json", doc);
        }

    private:
        fs::path root_;
    };

}  // namespace dsv::fixtures

#endif //DEPSIEVE_TEST_PROJECT_HPP
