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


#include "ledger_reader.h"
#include <assert.h>

namespace srcverify {
namespace verifier {

	bool ILedgerReader::Request::IsTransportOk() const
	{
		return m_TransportError.empty() && (m_vObjects.size() == m_vAddresses.size());
	}

	void ILedgerReader::PostRequest(Request& r, Request::IHandler& h)
	{
		assert(!r.m_pTrg);
		r.m_pTrg = &h;
		PostRequestInternal(r);
	}

} // namespace verifier
} // namespace srcverify
