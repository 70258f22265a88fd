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
#include "utility/common.h"
#include <stdexcept>
#include <string>

#define WardenErrorKinds(macro) \
	macro(InvalidDerivation) \
	macro(NonCanonicalBump) \
	macro(OwnershipMismatch) \
	macro(SchemaMismatch) \
	macro(Unauthorized) \
	macro(MissingSignature) \
	macro(InsufficientFunds) \
	macro(Overflow) \
	macro(Reentrant) \
	macro(InvalidProgram) \
	macro(CallbackFailed) \
	macro(InvariantViolated) \
	macro(NotRepaid) \
	macro(UnexpectedStateChange) \
	macro(InvalidDestination) \
	macro(NotEmpty) \
	macro(InvalidAmount) \
	macro(InvalidArgument) \
	macro(AlreadyInUse) \
	macro(ExceedsMaxSupply) \
	macro(InvalidFeeBps)

namespace warden
{
	struct ErrorKind
	{
		enum Enum {
			None = 0,
#define THE_MACRO(name) name,
			WardenErrorKinds(THE_MACRO)
#undef THE_MACRO
		};

		static const char* get_Name(Enum);

		// post-call invariant failures are refinements of InvariantViolated
		static bool IsInvariantViolation(Enum);
	};

	std::ostream& operator << (std::ostream&, ErrorKind::Enum);

	struct Exc
		:public std::runtime_error
	{
		ErrorKind::Enum m_Kind;

		Exc(const std::string& s, ErrorKind::Enum eKind)
			:std::runtime_error(s)
			,m_Kind(eKind)
		{
		}

		// Context trail, reported in the message of any failure raised while the checkpoint is alive
		struct Checkpoint
		{
			Checkpoint();
			~Checkpoint();

			Checkpoint(const Checkpoint&) = delete;
			Checkpoint& operator = (const Checkpoint&) = delete;

			virtual void Dump(std::ostream&) = 0;

			static void DumpAll(std::ostream&);

		private:
			Checkpoint* m_pNext;
			static thread_local Checkpoint* s_pTop;
		};

		struct CheckpointTxt
			:public Checkpoint
		{
			const char* m_sz;
			CheckpointTxt(const char* sz) :m_sz(sz) {}

			void Dump(std::ostream& os) override;
		};

		[[noreturn]] static void Fail(ErrorKind::Enum);
		[[noreturn]] static void Fail(ErrorKind::Enum, const char* sz);

		static void Test(bool b, ErrorKind::Enum eKind)
		{
			if (!b)
				Fail(eKind);
		}
	};

} // namespace warden
