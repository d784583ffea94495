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
#include "ledger_reader.h"
#include "../utility/containers.h"
#include <deque>

namespace srcverify {
namespace verifier {

	// Turns addresses into OnChainPackageData. Lookups are batched and posted concurrently,
	// at most nMaxInFlight requests outstanding.
	class PackageResolver
	{
	public:
		struct Resolved
		{
			Address m_Address;
			OnChainPackageData m_Data;
		};

		struct IHandler
		{
			// One call per completed batch
			virtual void OnResolved(std::vector<Resolved>&&) = 0;
			// Transport-level failure. No more results will follow
			virtual void OnReadFailure(const std::string& sErr) = 0;
		};

		PackageResolver(ILedgerReader&, uint32_t nMaxInFlight);
		~PackageResolver();

		// Returns false without touching the ledger if the placeholder address is among the addresses.
		// Results are delivered via IHandler, which may destroy the resolver from within any callback.
		bool Resolve(std::vector<Address>, IHandler&);

		// Abandons all the outstanding requests
		void Abort();

		uint32_t get_Posted() const { return m_Posted; }
		uint32_t get_InFlight() const { return static_cast<uint32_t>(m_lstInFlight.size()); }

		static OnChainPackageData Classify(const Address&, ILedgerReader::ObjectData&&);

	private:
		struct Batch
			:public boost::intrusive::list_base_hook<>
			,public ILedgerReader::Request::IHandler
		{
			PackageResolver* m_pThis = nullptr;
			ILedgerReader::Request::Ptr m_pRequest;

			virtual ~Batch();
			void OnComplete(ILedgerReader::Request&) override;
		};

		void PostMore();
		void OnBatchDone(Batch&);

		ILedgerReader& m_Reader;
		uint32_t m_MaxInFlight;
		uint32_t m_Posted = 0;
		IHandler* m_pHandler = nullptr;

		std::deque<Address> m_Queue;
		intrusive::owning_list<Batch> m_lstInFlight;
	};

} // namespace verifier
} // namespace srcverify
