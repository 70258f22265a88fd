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

#include "hash.h"
#include <openssl/evp.h>
#include <assert.h>
#include <stdexcept>

namespace warden
{
	Hash::Processor::Processor()
		:m_pCtx(EVP_MD_CTX_new())
		,m_bInitialized(false)
	{
		if (!m_pCtx)
			throw std::bad_alloc();

		Reset();
	}

	Hash::Processor::~Processor()
	{
		EVP_MD_CTX_free(m_pCtx);
	}

	void Hash::Processor::Reset()
	{
		if (!EVP_DigestInit_ex(m_pCtx, EVP_sha256(), nullptr))
			throw std::runtime_error("sha256 init");

		m_bInitialized = true;
	}

	void Hash::Processor::Write(const void* p, uint32_t n)
	{
		assert(m_bInitialized);
		if (n && !EVP_DigestUpdate(m_pCtx, p, n))
			throw std::runtime_error("sha256 update");
	}

	void Hash::Processor::Finalize(Value& v)
	{
		assert(m_bInitialized);

		unsigned int nSize = 0;
		if (!EVP_DigestFinal_ex(m_pCtx, v.m_pData, &nSize) || (nSize != v.nBytes))
			throw std::runtime_error("sha256 final");

		m_bInitialized = false;
	}

	void Hash::Processor::FinalizeTruncated(uint8_t* p, uint32_t nSize)
	{
		assert(nSize < Value::nBytes);

		Value hv;
		Finalize(hv);

		memcpy(p, hv.m_pData, nSize);
	}

	void Hash::Processor::Write(const Blob& v)
	{
		Write(v.p, v.n);
	}

	void Hash::Processor::Write(bool b)
	{
		uint8_t n = (false != b);
		Write(n);
	}

	void Hash::Processor::Write(uint8_t n)
	{
		Write(&n, sizeof(n));
	}

} // namespace warden
