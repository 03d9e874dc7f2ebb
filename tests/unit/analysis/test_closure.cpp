//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/analysis/closure.hpp"

#include <algorithm>
#include <random>

using namespace dsv;
using namespace dsv::analysis;

class ClosureTest : public ::testing::Test {
protected:
    void add(const std::string& name, std::set<std::string> files, std::set<std::string> requirers) {
        DependencyRecord record;
        record.name = name;
        record.used_in_files = std::move(files);
        record.required_by_packages = std::move(requirers);
        records[name] = std::move(record);
    }

    std::map<std::string, DependencyRecord> records;
};

TEST_F(ClosureTest, InitialUnusedHasNoEvidence) {
    add("lodash", {"src/a.js"}, {});
    add("debug", {}, {"express"});
    add("left-pad", {}, {});

    EXPECT_EQ(initial_unused(records), (std::set<std::string>{"left-pad"}));
}

TEST_F(ClosureTest, RequirerChainCollapses) {
    add("A", {}, {});
    add("B", {}, {"A"});
    add("C", {}, {"B"});

    const auto unused = finalize_unused(initial_unused(records), records);
    EXPECT_EQ(unused, (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(ClosureTest, FileUsageBlocksClosure) {
    add("A", {}, {});
    add("B", {"src/b.js"}, {"A"});
    add("C", {}, {"B"});

    EXPECT_EQ(finalize_unused(initial_unused(records), records), (std::vector<std::string>{"A"}));
}

TEST_F(ClosureTest, UsedRequirerKeepsDependency) {
    add("A", {}, {});
    add("framework", {"src/app.js"}, {});
    add("shared", {}, {"A", "framework"});

    EXPECT_EQ(finalize_unused(initial_unused(records), records), (std::vector<std::string>{"A"}));
}

TEST_F(ClosureTest, OutsideRequirerKeepsDependency) {
    add("A", {}, {});
    add("B", {}, {"A", "not-declared"});

    EXPECT_EQ(finalize_unused(initial_unused(records), records), (std::vector<std::string>{"A"}));
}

TEST_F(ClosureTest, ClosureIsIdempotent) {
    add("root", {}, {});
    add("mid", {}, {"root"});
    add("leaf", {}, {"mid"});
    add("kept", {"index.js"}, {"root"});

    const auto once = finalize_unused(initial_unused(records), records);
    const std::set<std::string> once_set(once.begin(), once.end());
    EXPECT_EQ(finalize_unused(once_set, records), once);
}

TEST_F(ClosureTest, IndependentOfInsertionOrder) {
    std::vector<std::string> names;
    for (int i = 0; i < 20; ++i) {
        names.push_back("pkg-" + std::to_string(i));
    }
    std::mt19937 rng(42);
    std::ranges::shuffle(names, rng);

    for (std::size_t i = 0; i < names.size(); ++i) {
        std::set<std::string> requirers;
        if (i > 0) {
            requirers.insert(names[i - 1]);
        }
        add(names[i], {}, requirers);
    }

    const auto unused = finalize_unused(initial_unused(records), records);
    EXPECT_EQ(unused.size(), names.size());
    EXPECT_TRUE(std::ranges::is_sorted(unused));
}
