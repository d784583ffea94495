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


#include "address.h"
#include "../utility/hex.h"
#include <assert.h>
#include <stdexcept>

namespace srcverify
{
	bool Address::Scan(std::string_view sz)
	{
		sz = strip_hex_prefix(sz);
		if (sz.empty() || (sz.size() > nBytes * 2))
			return false;

		bool bValid = false;
		ByteBuffer bb = from_hex(sz, &bValid);
		if (!bValid)
			return false;

		assert(bb.size() <= nBytes);
		ZeroObject(m_pData);
		memcpy(m_pData + nBytes - bb.size(), bb.data(), bb.size());
		return true;
	}

	Address Address::FromHex(std::string_view sz)
	{
		Address a;
		if (!a.Scan(sz))
			throw std::invalid_argument("bad address: " + std::string(sz));
		return a;
	}

	std::string Address::str() const
	{
		return "0x" + to_hex(m_pData, nBytes);
	}

	std::ostream& operator << (std::ostream& s, const Address& a)
	{
		char sz[Address::nBytes * 2 + 1];
		to_hex(sz, a.m_pData, Address::nBytes);
		return s << "0x" << sz;
	}

} // namespace srcverify
