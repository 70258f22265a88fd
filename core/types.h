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
#include "uintBig.h"

namespace warden
{
	// Account location in the store
	typedef uintBig_t<32> Address;

	// 32-byte identity. For keys it's the x-coordinate of the secp256k1 public point, whose y is even
	typedef uintBig_t<32> PeerID;

	// Owner of wallets and of closed (delisted) accounts
	static const PeerID s_SystemID = Zero;
}
