// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "utility/cli/options.h"
#include <iostream>
#include <string>
#include <vector>

using namespace warden;

static int error_count = 0;

#define CHECK(s) \
do {\
    if (!(s)) {\
        std::cout << "Check failed! Line=" << __LINE__ << ", Expression: " << #s << '\n';\
        ++error_count;\
    }\
} while(false)\

namespace {

// parsed options refer to the description, both live here
struct CommandLine {
    std::pair<po::options_description, po::options_description> opts = createOptionsDescription();
    std::vector<std::string> args;
    std::vector<char*> argv;

    CommandLine(std::initializer_list<const char*> lst) : args(lst.begin(), lst.end()) {
        for (auto& s : args) argv.push_back(&s[0]);
    }

    po::parsed_options parse() {
        return parseOptions(int(argv.size()), argv.data(), opts.first);
    }
};

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} //namespace

void test_seed_order() {
    {
        CommandLine cl{ "warden", "derive", "--seed_hex", "aabb", "--seed", "user" };
        auto seeds = getSeeds(cl.parse());
        CHECK(seeds.size() == 2);
        CHECK(seeds[0] == (std::vector<uint8_t>{ 0xaa, 0xbb }));
        CHECK(seeds[1] == bytes("user"));
    }
    {
        CommandLine cl{ "warden", "derive", "--seed", "vault", "--seed_hex", "01", "--seed", "tail" };
        auto seeds = getSeeds(cl.parse());
        CHECK(seeds.size() == 3);
        CHECK(seeds[0] == bytes("vault"));
        CHECK(seeds[1] == std::vector<uint8_t>(1, 1));
        CHECK(seeds[2] == bytes("tail"));
    }
    {
        // several values after one flag
        CommandLine cl{ "warden", "derive", "--seed", "a", "b", "--seed_hex", "0c" };
        auto seeds = getSeeds(cl.parse());
        CHECK(seeds.size() == 3);
        CHECK(seeds[0] == bytes("a"));
        CHECK(seeds[1] == bytes("b"));
        CHECK(seeds[2] == std::vector<uint8_t>(1, 0x0c));
    }
    {
        CommandLine cl{ "warden", "derive", "--program", "00" };
        CHECK(getSeeds(cl.parse()).empty());
    }
}

void test_bad_seed() {
    CommandLine cl{ "warden", "derive", "--seed", "ok", "--seed_hex", "xyz" };
    auto parsed = cl.parse();

    bool bThrown = false;
    try {
        getSeeds(parsed);
    } catch (const po::error&) {
        bThrown = true;
    }
    CHECK(bThrown);
}

void test_variables() {
    CommandLine cl{ "warden", "verify", "--bump", "254", "--log_level", "debug" };
    po::variables_map vm = getOptions(cl.parse());

    CHECK(vm[cli::COMMAND].as<std::string>() == cli::CMD_VERIFY);
    CHECK(vm[cli::BUMP].as<uint32_t>() == 254);
    CHECK(getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_WARNING) == LOG_LEVEL_DEBUG);
    CHECK(getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED) == LOG_SINK_DISABLED);
    CHECK(getLogLevel("loud", LOG_LEVEL_WARNING) == LOG_LEVEL_WARNING);

    CommandLine clVersion{ "warden", "--version" };
    po::variables_map vmVersion = getOptions(clVersion.parse());
    CHECK(vmVersion.count(cli::VERSION));
    CHECK(!vmVersion.count(cli::COMMAND));
}

int main() {
    try {
        test_seed_order();
        test_bad_seed();
        test_variables();
    }
    catch (const std::exception& e) {
        std::cout << "Exception: " << e.what() << '\n';
        ++error_count;
    }
    return error_count;
}
