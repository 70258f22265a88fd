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

#include "exc.h"
#include <sstream>

namespace warden
{
	const char* ErrorKind::get_Name(Enum e)
	{
		switch (e)
		{
#define THE_MACRO(name) case name: return #name;
		WardenErrorKinds(THE_MACRO)
#undef THE_MACRO

		default:
			break;
		}

		return "Error";
	}

	bool ErrorKind::IsInvariantViolation(Enum e)
	{
		switch (e)
		{
		case InvariantViolated:
		case NotRepaid:
		case UnexpectedStateChange:
			return true;

		default:
			return false;
		}
	}

	std::ostream& operator << (std::ostream& os, ErrorKind::Enum e)
	{
		os << ErrorKind::get_Name(e);
		return os;
	}

	///////////////////////
	// Checkpoint

	thread_local Exc::Checkpoint* Exc::Checkpoint::s_pTop = nullptr;

	Exc::Checkpoint::Checkpoint()
	{
		m_pNext = s_pTop;
		s_pTop = this;
	}

	Exc::Checkpoint::~Checkpoint()
	{
		s_pTop = m_pNext;
	}

	void Exc::Checkpoint::DumpAll(std::ostream& os)
	{
		for (Checkpoint* p = s_pTop; p; p = p->m_pNext)
		{
			os << " <- ";
			p->Dump(os);
		}
	}

	void Exc::CheckpointTxt::Dump(std::ostream& os) {
		os << m_sz;
	}

	void Exc::Fail(ErrorKind::Enum eKind)
	{
		Fail(eKind, nullptr);
	}

	void Exc::Fail(ErrorKind::Enum eKind, const char* sz)
	{
		std::ostringstream os;
		os << eKind;
		if (sz)
			os << " (" << sz << ")";

		Checkpoint::DumpAll(os);

		throw Exc(os.str(), eKind);
	}

} // namespace warden
