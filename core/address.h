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
#include "../utility/common.h"
#include "../utility/serialize_fwd.h"
#include <string>
#include <functional>
#include <ostream>
#include <string_view>

namespace srcverify
{
	// Syntactic sugar!
	enum Zero_ { Zero };

	// Ledger object/package address. 32 bytes, big-endian as printed.
	// The all-zero value is reserved: packages are compiled against it before they get a real address
	struct Address
	{
		static const uint32_t nBytes = 32;

		uint8_t m_pData[nBytes];

		Address()
		{
#ifdef _DEBUG
			memset(m_pData, 0xcd, nBytes);
#endif // _DEBUG
		}

		Address(Zero_)
		{
			ZeroObject(m_pData);
		}

		Address(const uint8_t p[nBytes])
		{
			memcpy(m_pData, p, nBytes);
		}

		Address& operator = (Zero_)
		{
			ZeroObject(m_pData);
			return *this;
		}

		bool operator == (Zero_) const
		{
			return memis0(m_pData, nBytes);
		}

		bool operator != (Zero_) const
		{
			return !(*this == Zero);
		}

		bool IsPlaceholder() const { return *this == Zero; }

		// from ordinal types, lowest bytes
		template <typename T>
		static Address FromOrdinal(T x)
		{
			static_assert(T(-1) > 0, "must be unsigned");
			Address a(Zero);
			for (uint32_t i = nBytes; i-- && x; x >>= 8)
				a.m_pData[i] = (uint8_t) x;
			return a;
		}

		// accepts optional 0x prefix and short forms (left-padded). Returns false on garbage
		bool Scan(std::string_view);
		static Address FromHex(std::string_view); // throws std::invalid_argument

		std::string str() const;

		int cmp(const Address& x) const { return memcmp(m_pData, x.m_pData, nBytes); }
		COMPARISON_VIA_CMP

		operator Blob () const { return Blob(m_pData, nBytes); }

		SERIALIZE(m_pData)
	};

	std::ostream& operator << (std::ostream&, const Address&);

} // namespace srcverify

namespace std
{
	template <>
	struct hash<srcverify::Address>
	{
		size_t operator()(const srcverify::Address& a) const
		{
			size_t res;
			static_assert(sizeof(res) <= srcverify::Address::nBytes);
			memcpy(&res, a.m_pData + srcverify::Address::nBytes - sizeof(res), sizeof(res));
			return res;
		}
	};
}
