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
#pragma once

#include <boost/program_options.hpp>
#include <utility>
#include "utility/logger.h"

namespace warden
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* COMMAND;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_ERROR;
        extern const char* LOG_WARNING;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        extern const char* CONFIG_FILE_PATH;
        extern const char* SEED;
        extern const char* SEED_HEX;
        extern const char* PROGRAM;
        extern const char* ADDRESS;
        extern const char* BUMP;
        extern const char* KEY_SEED;

        // commands
        extern const char* CMD_DERIVE;
        extern const char* CMD_VERIFY;
        extern const char* CMD_DEMO;
        extern const char* CMD_KEYGEN;
    }

    // returns all options and the visible (help) subset
    std::pair<po::options_description, po::options_description> createOptionsDescription();

    // parses the command line, the first positional token is the command
    po::parsed_options parseOptions(int argc, char* argv[], const po::options_description& options);
    po::variables_map getOptions(const po::parsed_options& parsed);

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);
    int getLogLevel(const std::string &sLevel, int defaultValue);

    // --seed (text) and --seed_hex values, in command line order
    std::vector<std::vector<uint8_t> > getSeeds(const po::parsed_options& parsed);
}
