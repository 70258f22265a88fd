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
#include "records.h"
#include "auth.h"

namespace warden
{
	struct ClosureRequest
	{
		Address m_Account = Zero;
		Address m_Destination = Zero;
		Address m_Expected = Zero; // the only destination the caller accepts
		bool m_bRequireEmpty = false;
	};

	// Drains a record into a validated destination, clears and delists it. All-or-nothing
	class ClosureEngine
	{
		IStore& m_Store;
		const PeerID& m_Controller;

	public:
		ClosureEngine(IStore&, const PeerID& controller);

		// returns the residual value moved to the destination
		Amount Close(const AuthContext&, const PeerID& authority, const ClosureRequest&);
	};

} // namespace warden
