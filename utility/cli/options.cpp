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

#include "options.h"
#include "utility/hex.h"
#include <map>

using namespace std;

namespace warden
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* COMMAND = "command";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_ERROR = "error";
        const char* LOG_WARNING = "warning";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        const char* CONFIG_FILE_PATH = "config";
        const char* SEED = "seed";
        const char* SEED_HEX = "seed_hex";
        const char* PROGRAM = "program";
        const char* ADDRESS = "address";
        const char* BUMP = "bump";
        const char* KEY_SEED = "key_seed";

        const char* CMD_DERIVE = "derive";
        const char* CMD_VERIFY = "verify";
        const char* CMD_DEMO = "demo";
        const char* CMD_KEYGEN = "keygen";
    }

    pair<po::options_description, po::options_description> createOptionsDescription()
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list all available options and commands")
            (cli::VERSION_FULL, "print project version")
            (cli::LOG_LEVEL, po::value<string>(), "set log level [error|warning(default)|info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "set file log level, file log is off unless specified")
            (cli::CONFIG_FILE_PATH, po::value<string>(), "path to the JSON config file");

        po::options_description derivation_options("Derivation options");
        derivation_options.add_options()
            (cli::SEED, po::value<vector<string> >()->multitoken(), "seed as text, may be repeated")
            (cli::SEED_HEX, po::value<vector<string> >()->multitoken(), "seed as hex bytes, may be repeated")
            (cli::PROGRAM, po::value<string>(), "controller identity (hex), overrides program_id from config")
            (cli::ADDRESS, po::value<string>(), "candidate address (hex) to verify")
            (cli::BUMP, po::value<uint32_t>(), "candidate bump [0..255] to verify")
            (cli::KEY_SEED, po::value<string>(), "secret seed phrase for keygen");

        po::options_description commands("Commands");
        commands.add_options()
            (cli::COMMAND, po::value<string>(), "command to execute [derive|verify|demo|keygen]");

        po::options_description options{ "Allowed options" };
        options.add(general_options)
               .add(derivation_options)
               .add(commands);

        po::options_description visibleOptions{ "Allowed options" };
        visibleOptions.add(general_options)
                      .add(derivation_options);

        return { options, visibleOptions };
    }

    po::parsed_options parseOptions(int argc, char* argv[], const po::options_description& options)
    {
        po::positional_options_description positional;
        positional.add(cli::COMMAND, 1);

        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.style(po::command_line_style::default_style ^ po::command_line_style::allow_guessing);
        parser.positional(positional);

        return parser.run();
    }

    po::variables_map getOptions(const po::parsed_options& parsed)
    {
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        return vm;
    }

    int getLogLevel(const std::string &sLevel, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_ERROR, LOG_LEVEL_ERROR },
            { cli::LOG_WARNING, LOG_LEVEL_WARNING },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (auto it = logLevels.find(sLevel); it != logLevels.end())
        {
            return it->second;
        }

        return defaultValue;
    }

    int getLogLevel(const std::string &dstLog, const po::variables_map& vm, int defaultValue)
    {
        if (vm.count(dstLog))
        {
            return getLogLevel(vm[dstLog].as<string>(), defaultValue);
        }

        return defaultValue;
    }

    vector<vector<uint8_t> > getSeeds(const po::parsed_options& parsed)
    {
        vector<vector<uint8_t> > seeds;

        for (const auto& opt : parsed.options)
        {
            if (opt.string_key == cli::SEED)
            {
                for (const auto& s : opt.value)
                    seeds.emplace_back(s.begin(), s.end());
            }
            else if (opt.string_key == cli::SEED_HEX)
            {
                for (const auto& s : opt.value)
                {
                    bool bValid = false;
                    auto bytes = from_hex(s, &bValid);
                    if (!bValid)
                        throw po::invalid_option_value(s);

                    seeds.push_back(std::move(bytes));
                }
            }
        }

        return seeds;
    }
}
