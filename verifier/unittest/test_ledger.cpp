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


#include "test_ledger.h"
#include "verifier/dependency_walker.h"

namespace srcverify {
namespace verifier {
namespace test {

	void TestLedger::PostRequestInternal(Request& r)
	{
		m_Requests++;
		m_AddressesRead += static_cast<uint32_t>(r.m_vAddresses.size());
		m_Queue.push_back(&r);

		setmax(m_PeakInFlight, get_InFlight());
	}

	uint32_t TestLedger::get_InFlight() const
	{
		uint32_t n = 0;
		for (const auto& pReq : m_Queue)
			if (pReq->m_pTrg)
				n++;
		return n;
	}

	void TestLedger::ResetStats()
	{
		m_Requests = 0;
		m_AddressesRead = 0;
		m_PeakInFlight = 0;
	}

	bool TestLedger::CompleteOne(bool bNewest)
	{
		if (m_Queue.empty())
			return false;

		Request::Ptr pReq;
		if (bNewest)
		{
			pReq = std::move(m_Queue.back());
			m_Queue.pop_back();
		}
		else
		{
			pReq = std::move(m_Queue.front());
			m_Queue.pop_front();
		}

		if (pReq->m_pTrg)
			Complete(*pReq);

		return true;
	}

	uint32_t TestLedger::Pump(bool bNewest)
	{
		uint32_t n = 0;
		for (; CompleteOne(bNewest); n++)
			;
		return n;
	}

	void TestLedger::Complete(Request& r)
	{
		if (m_Offline)
			r.m_TransportError = m_OfflineError;
		else
		{
			for (const auto& addr : r.m_vAddresses)
			{
				auto it = m_Objects.find(addr);
				if (m_Objects.end() == it)
				{
					ObjectData& od = r.m_vObjects.emplace_back();
					od.m_Detail = "object deleted or never existed";
				}
				else
					r.m_vObjects.push_back(it->second);
			}
		}

		r.m_pTrg->OnComplete(r);
	}

	Address TestLedger::AllocAddress()
	{
		return Address::FromOrdinal(++m_LastAddress);
	}

	Address TestLedger::Publish(const CompiledPackage& pkg, bool bWithUnpublishedDeps)
	{
		Address addr = AllocAddress();
		Address zero(Zero);

		std::map<std::string, ByteBuffer> modules;

		for (const auto& m : pkg.m_vModules)
			SubstituteAddress(m.m_Bytes, zero, addr, modules[m.m_Name]);

		if (bWithUnpublishedDeps)
		{
			DependencyClosure dc = DependencyWalker::Walk(pkg);
			for (const auto* pModule : dc.m_vBundled)
				if (modules.find(pModule->m_Name) == modules.end())
					SubstituteAddress(pModule->m_Bytes, zero, addr, modules[pModule->m_Name]);
		}

		PublishAt(addr, std::move(modules));
		return addr;
	}

	void TestLedger::PublishAt(const Address& addr, std::map<std::string, ByteBuffer>&& modules)
	{
		ObjectData& od = m_Objects[addr];
		od = ObjectData();
		od.m_Kind = ObjectData::Kind::Package;
		od.m_Modules = std::move(modules);
	}

	void TestLedger::AddObject(const Address& addr, const std::string& sType)
	{
		ObjectData& od = m_Objects[addr];
		od = ObjectData();
		od.m_Kind = ObjectData::Kind::Object;
		od.m_Type = sType;
	}

	void TestLedger::Remove(const Address& addr)
	{
		m_Objects.erase(addr);
	}

} // namespace test
} // namespace verifier
} // namespace srcverify
