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

#include "program/processor.h"
#include "core/strict.h"
#include "utility/cli/options.h"
#include "utility/config.h"
#include "utility/logger.h"

#include <boost/filesystem.hpp>
#include <iostream>

using namespace std;
using namespace warden;

#ifndef WARDEN_VERSION
#	define WARDEN_VERSION "0.0.0"
#endif

namespace
{
	void printHelp(const po::options_description& options)
	{
		cout << "Usage: warden <derive|verify|demo|keygen> [options]" << endl;
		cout << options << endl;
	}

	PeerID parseID(const string& s, const char* szWhat)
	{
		PeerID id;
		if (!id.Scan(s))
			throw po::invalid_option_value(string(szWhat) + "=" + s);
		return id;
	}

	PeerID getController(const po::variables_map& vm)
	{
		if (vm.count(cli::PROGRAM))
			return parseID(vm[cli::PROGRAM].as<string>(), cli::PROGRAM);

		string s = config().get_string("program_id");
		if (s.empty())
			throw runtime_error("controller identity is not specified, use --program or program_id in config");

		return parseID(s, "program_id");
	}

	typedef vector<vector<uint8_t> > Seeds;

	Derivation getDerivation(const po::variables_map& vm, const Seeds& vSeeds)
	{
		Derivation d(getController(vm));
		for (const auto& seed : vSeeds)
			d << Blob(seed);
		return d;
	}

	int cmdDerive(const po::variables_map& vm, const Seeds& vSeeds)
	{
		Derivation d = getDerivation(vm, vSeeds);

		Address addr;
		uint8_t nBump = d.Find(addr);

		cout << "address: " << addr << endl;
		cout << "bump: " << static_cast<uint32_t>(nBump) << endl;
		return 0;
	}

	int cmdVerify(const po::variables_map& vm, const Seeds& vSeeds)
	{
		if (!vm.count(cli::ADDRESS) || !vm.count(cli::BUMP))
			throw po::required_option(string(cli::ADDRESS) + ", " + cli::BUMP);

		uint32_t nBump = vm[cli::BUMP].as<uint32_t>();
		if (nBump > 0xff)
			throw po::invalid_option_value(std::to_string(nBump));

		Derivation d = getDerivation(vm, vSeeds);
		Address addr = parseID(vm[cli::ADDRESS].as<string>(), cli::ADDRESS);

		try
		{
			d.Verify(addr, static_cast<uint8_t>(nBump));
		}
		catch (const Exc& e)
		{
			cout << "rejected: " << e.m_Kind << endl;
			LOG_DEBUG() << e.what();
			return -1;
		}

		cout << "valid" << endl;
		return 0;
	}

	int cmdKeygen(const po::variables_map& vm)
	{
		if (!vm.count(cli::KEY_SEED))
			throw po::required_option(cli::KEY_SEED);

		string sSeed = vm[cli::KEY_SEED].as<string>();
		Curve::KeyPair kp(sSeed);

		cout << "identity: " << kp.get_ID() << endl;
		return 0;
	}

	// Flash-loan borrower used by the demo. Tries to re-enter the loan, then repays with the fee
	struct DemoBorrower
		:public ICallTarget
	{
		Processor& m_Proc;
		const Curve::KeyPair& m_kpAuthority;
		Curve::KeyPair m_Kp;

		DemoBorrower(Processor& p, const Curve::KeyPair& kpAuthority)
			:m_Proc(p)
			,m_kpAuthority(kpAuthority)
			,m_Kp(Blob::FromSz("demo.borrower"))
		{
		}

		static AuthContext SignedBy(const Curve::KeyPair& kp, const char* szOp)
		{
			Hash::Value msg;
			Hash::Processor() << "demo" << std::string(szOp) >> msg;

			Curve::Signature sig;
			kp.Sign(sig, msg);

			AuthContext ctx;
			ctx.AddVerified(kp.get_ID(), msg, sig);
			return ctx;
		}

		CallStatus::Enum Invoke(const CallArgs& args) override
		{
			try
			{
				m_Proc.FlashLoan(SignedBy(m_kpAuthority, "reenter"), m_kpAuthority.get_ID(), args.m_Vault, m_Kp.get_ID(), args.m_Amount, args.m_Fee);
				LOG_ERROR() << "re-entry was accepted";
				return CallStatus::Failed;
			}
			catch (const Exc& e)
			{
				LOG_INFO() << "borrower: re-entry rejected with " << e.m_Kind;
			}

			Amount val = args.m_Amount;
			Strict::Add(val, args.m_Fee);
			m_Proc.Deposit(SignedBy(m_Kp, "repay"), m_Kp.get_ID(), args.m_Vault, val);
			return CallStatus::Ok;
		}
	};

	void demoExpect(const char* szWhat, ErrorKind::Enum eExpected, const std::function<void()>& fn)
	{
		ErrorKind::Enum eKind = ErrorKind::None;
		try
		{
			fn();
		}
		catch (const Exc& e)
		{
			eKind = e.m_Kind;
		}

		if (eKind != eExpected)
			throw runtime_error(string(szWhat) + ": unexpected outcome " + ErrorKind::get_Name(eKind));

		cout << szWhat << ": " << (ErrorKind::None == eKind ? "ok" : ErrorKind::get_Name(eKind)) << endl;
	}

	int cmdDemo(const po::variables_map& vm)
	{
		PeerID controller;
		if (vm.count(cli::PROGRAM) || config().has_key("program_id"))
			controller = getController(vm);
		else
			Hash::Processor() << "warden.demo" >> controller;

		Curve::KeyPair kpA(Blob::FromSz("demo.alice"));
		Curve::KeyPair kpB(Blob::FromSz("demo.bob"));

		PeerID admin = kpA.get_ID();
		if (config().has_key("admin"))
			admin = parseID(config().get_string("admin"), "admin");

		TrustedTargets trusted(config());
		MemStore store;
		CallRouter router;
		Processor proc(store, router, trusted, controller, admin);

		store.SetWallet(kpA.get_ID(), 1000);

		auto fnVault = [&](const Address& addr) {
			Account acc;
			store.Get(addr, acc);
			Vault v;
			Records::Load(v, acc, controller);
			return v;
		};

		cout << "controller: " << controller << endl;

		Address addr;
		demoExpect("initialize vault 1000 by A", ErrorKind::None, [&]() {
			addr = proc.InitializeVault(DemoBorrower::SignedBy(kpA, "init"), kpA.get_ID(), 1000);
		});
		cout << "vault: " << addr << endl;

		demoExpect("withdraw 1500 by A", ErrorKind::InsufficientFunds, [&]() {
			proc.Withdraw(DemoBorrower::SignedBy(kpA, "w1"), kpA.get_ID(), addr, 1500);
		});
		demoExpect("withdraw 400 by A", ErrorKind::None, [&]() {
			proc.Withdraw(DemoBorrower::SignedBy(kpA, "w2"), kpA.get_ID(), addr, 400);
		});
		demoExpect("withdraw 400 by B", ErrorKind::Unauthorized, [&]() {
			proc.Withdraw(DemoBorrower::SignedBy(kpB, "w3"), kpB.get_ID(), addr, 400);
		});
		cout << "balance: " << fnVault(addr).m_Balance << endl;

		DemoBorrower borrower(proc, kpA);
		router.Register(borrower.m_Kp.get_ID(), borrower);
		store.SetWallet(borrower.m_Kp.get_ID(), 10);

		demoExpect("bind borrower", ErrorKind::None, [&]() {
			proc.BindCallback(DemoBorrower::SignedBy(kpA, "bind"), kpA.get_ID(), addr, borrower.m_Kp.get_ID());
		});
		demoExpect("flash loan 100, fee 1", ErrorKind::None, [&]() {
			proc.FlashLoan(DemoBorrower::SignedBy(kpA, "loan"), kpA.get_ID(), addr, borrower.m_Kp.get_ID(), 100, 1);
		});

		Vault v = fnVault(addr);
		cout << "balance: " << v.m_Balance << (v.IsLocked() ? " (locked)" : " (idle)") << endl;

		demoExpect("close vault to A", ErrorKind::None, [&]() {
			proc.CloseVault(DemoBorrower::SignedBy(kpA, "close"), kpA.get_ID(), addr, kpA.get_ID());
		});
		demoExpect("withdraw from closed vault", ErrorKind::OwnershipMismatch, [&]() {
			proc.Withdraw(DemoBorrower::SignedBy(kpA, "w4"), kpA.get_ID(), addr, 1);
		});

		store.Commit();
		return 0;
	}
}

int main_impl(int argc, char* argv[])
{
	try
	{
		auto [options, visibleOptions] = createOptionsDescription();

		po::variables_map vm;
		Seeds vSeeds;
		try
		{
			po::parsed_options parsed = parseOptions(argc, argv, options);
			vm = getOptions(parsed);
			vSeeds = getSeeds(parsed);
		}
		catch (const po::error& e)
		{
			cout << e.what() << std::endl;
			printHelp(visibleOptions);

			return -1;
		}

		if (vm.count(cli::VERSION))
		{
			cout << WARDEN_VERSION << endl;
			return 0;
		}

		if (vm.count(cli::HELP) || !vm.count(cli::COMMAND))
		{
			printHelp(visibleOptions);

			return 0;
		}

		if (vm.count(cli::CONFIG_FILE_PATH))
		{
			Config cfg;
			cfg.load(vm[cli::CONFIG_FILE_PATH].as<string>());
			reset_global_config(std::move(cfg));
		}

		int logLevel = getLogLevel(config().get_string(cli::LOG_LEVEL), LOG_LEVEL_WARNING);
		logLevel = getLogLevel(cli::LOG_LEVEL, vm, logLevel);
		int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);

#define LOG_FILES_DIR "logs"
#define LOG_FILES_PREFIX "warden_"

		string logPath;
		if (fileLogLevel != LOG_SINK_DISABLED)
			logPath = boost::filesystem::system_complete(LOG_FILES_DIR).string();

		auto logger = Logger::create(LOG_LEVEL_WARNING, logLevel, fileLogLevel, LOG_FILES_PREFIX, logPath);

		try
		{
			const string& cmd = vm[cli::COMMAND].as<string>();
			LOG_DEBUG() << "warden " << WARDEN_VERSION << " " << cmd;

			if (cmd == cli::CMD_DERIVE)
				return cmdDerive(vm, vSeeds);

			if (cmd == cli::CMD_VERIFY)
				return cmdVerify(vm, vSeeds);

			if (cmd == cli::CMD_KEYGEN)
				return cmdKeygen(vm);

			if (cmd == cli::CMD_DEMO)
				return cmdDemo(vm);

			LOG_ERROR() << "unknown command: " << cmd;
			printHelp(visibleOptions);
		}
		catch (const po::error& e)
		{
			LOG_ERROR() << e.what();
			printHelp(visibleOptions);
		}
		catch (const Exc& e)
		{
			LOG_ERROR() << e.what();
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR() << e.what();
		}
	}
	catch (const std::exception& e)
	{
		std::cout << e.what() << std::endl;
	}

	return -1;
}

int main(int argc, char* argv[])
{
	return main_impl(argc, argv);
}
