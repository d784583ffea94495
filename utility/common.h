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

#include <vector>
#include <stdint.h>
#include <string.h>
#include <type_traits>

#define COMPARISON_VIA_CMP \
	template <typename T> bool operator < (const T& x) const { return cmp(x) < 0; } \
	template <typename T> bool operator > (const T& x) const { return cmp(x) > 0; } \
	template <typename T> bool operator <= (const T& x) const { return cmp(x) <= 0; } \
	template <typename T> bool operator >= (const T& x) const { return cmp(x) >= 0; } \
	template <typename T> bool operator == (const T& x) const { return cmp(x) == 0; } \
	template <typename T> bool operator != (const T& x) const { return cmp(x) != 0; }

namespace srcverify
{
	typedef std::vector<uint8_t> ByteBuffer;

	bool memis0(const void* p, size_t n);

	template <typename T>
	inline void ZeroObject(T& x)
	{
		static_assert(std::is_trivially_destructible_v<T>);
		memset(&x, 0, sizeof(x));
	}

	template <typename TDst, typename TSrc>
	inline void setmax(TDst& a, TSrc b)
	{
		if (a < b)
			a = b;
	}

	// Module bytes as handed to the loader and the normalizer. Does not own the data
	struct Blob
	{
		const void* p = nullptr;
		uint32_t n = 0;

		Blob() = default;
		Blob(const void* p_, uint32_t n_) :p(p_), n(n_) {}
		Blob(const ByteBuffer& bb);

		void Export(ByteBuffer&) const;
	};

} // namespace srcverify
