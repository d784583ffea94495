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


#include "package_resolver.h"
#include "../utility/logger.h"
#include <algorithm>
#include <assert.h>
#include <sstream>

namespace srcverify {
namespace verifier {

	PackageResolver::PackageResolver(ILedgerReader& r, uint32_t nMaxInFlight)
		:m_Reader(r)
		,m_MaxInFlight(std::max<uint32_t>(nMaxInFlight, 1))
	{
	}

	PackageResolver::~PackageResolver()
	{
		Abort();
	}

	PackageResolver::Batch::~Batch()
	{
		if (m_pRequest)
		{
			m_pRequest->m_pTrg = nullptr;
			m_pRequest.reset();
		}
	}

	void PackageResolver::Abort()
	{
		m_Queue.clear();
		m_lstInFlight.Clear();
	}

	bool PackageResolver::Resolve(std::vector<Address> vAddrs, IHandler& h)
	{
		std::sort(vAddrs.begin(), vAddrs.end());
		vAddrs.erase(std::unique(vAddrs.begin(), vAddrs.end()), vAddrs.end());

		for (const auto& a : vAddrs)
			if (a.IsPlaceholder())
				return false;

		m_pHandler = &h;
		m_Queue.insert(m_Queue.end(), vAddrs.begin(), vAddrs.end());
		PostMore();
		return true;
	}

	void PackageResolver::PostMore()
	{
		uint32_t nMaxBatch = std::max<uint32_t>(m_Reader.get_MaxBatch(), 1);

		while (!m_Queue.empty() && (m_lstInFlight.size() < m_MaxInFlight))
		{
			Batch& b = m_lstInFlight.Create_back();
			b.m_pThis = this;
			b.m_pRequest = new ILedgerReader::Request;

			auto& vAddrs = b.m_pRequest->m_vAddresses;
			while (!m_Queue.empty() && (vAddrs.size() < nMaxBatch))
			{
				vAddrs.push_back(m_Queue.front());
				m_Queue.pop_front();
			}

			m_Posted++;
			LOG_VERBOSE() << "resolver: posting " << vAddrs.size() << " address(es), in flight " << m_lstInFlight.size();

			m_Reader.PostRequest(*b.m_pRequest, b);
		}
	}

	void PackageResolver::Batch::OnComplete(ILedgerReader::Request& r)
	{
		assert(m_pRequest && (this == r.m_pTrg));
		r.m_pTrg = nullptr;
		m_pThis->OnBatchDone(*this);
	}

	void PackageResolver::OnBatchDone(Batch& b)
	{
		ILedgerReader::Request::Ptr pRequest = std::move(b.m_pRequest);
		m_lstInFlight.Delete(b);

		IHandler& h = *m_pHandler;

		if (!pRequest->IsTransportOk())
		{
			std::string sErr = pRequest->m_TransportError.empty() ?
				"malformed response: " + std::to_string(pRequest->m_vObjects.size()) + " object(s) for " + std::to_string(pRequest->m_vAddresses.size()) + " address(es)" :
				pRequest->m_TransportError;

			Abort();
			h.OnReadFailure(sErr);
			return; // this might have been destroyed
		}

		std::vector<Resolved> vRes;
		vRes.reserve(pRequest->m_vAddresses.size());

		for (size_t i = 0; i < pRequest->m_vAddresses.size(); i++)
		{
			const Address& addr = pRequest->m_vAddresses[i];
			vRes.push_back(Resolved{ addr, Classify(addr, std::move(pRequest->m_vObjects[i])) });
		}

		PostMore();
		h.OnResolved(std::move(vRes));
	}

	OnChainPackageData PackageResolver::Classify(const Address& addr, ILedgerReader::ObjectData&& od)
	{
		typedef ILedgerReader::ObjectData::Kind Kind;

		switch (od.m_Kind)
		{
		case Kind::Package:
			return OnChain::Package{ std::move(od.m_Modules) };

		case Kind::Object:
			return OnChain::NonPackageObject{ addr, od.m_Type.empty() ? std::string("object") : std::move(od.m_Type) };

		default:
			break;
		}

		std::ostringstream os;
		os << "no object at " << addr;
		if (!od.m_Detail.empty())
			os << ": " << od.m_Detail;

		return OnChain::NotFound{ addr, os.str() };
	}

} // namespace verifier
} // namespace srcverify
