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


#include "common.h"

namespace srcverify
{
	bool memis0(const void* p, size_t n)
	{
		const uint8_t* pB = static_cast<const uint8_t*>(p);
		for (size_t i = 0; i < n; i++)
			if (pB[i])
				return false;
		return true;
	}

	Blob::Blob(const ByteBuffer& bb)
	{
		n = static_cast<uint32_t>(bb.size());
		if (n)
			p = bb.data();
	}

	void Blob::Export(ByteBuffer& x) const
	{
		const uint8_t* pB = static_cast<const uint8_t*>(p);
		x.assign(pB, pB + n);
	}

} // namespace srcverify
