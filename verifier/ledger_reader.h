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
#include "../core/package.h"
#include <boost/intrusive_ptr.hpp>

namespace srcverify {
namespace verifier {

	// Read-only ledger client. The only network boundary of the verifier.
	struct ILedgerReader
	{
		struct ObjectData
		{
			enum struct Kind {
				Missing, // no object at the address (never existed, or deleted)
				Package,
				Object, // an ordinary (non-package) object
			};

			Kind m_Kind = Kind::Missing;
			std::string m_Type; // on-chain type, for Kind::Object
			std::string m_Detail; // reason, for Kind::Missing
			std::map<std::string, ByteBuffer> m_Modules; // for Kind::Package
		};

		class Request
		{
			int m_Refs = 0;
			friend void intrusive_ptr_add_ref(Request* p) { p->AddRef(); }
			friend void intrusive_ptr_release(Request* p) { p->Release(); }
		public:

			typedef boost::intrusive_ptr<Request> Ptr;

			void AddRef() { m_Refs++; }
			void Release() { if (!--m_Refs) delete this; }

			virtual ~Request() {}

			struct IHandler {
				virtual void OnComplete(Request&) = 0;
			};

			IHandler* m_pTrg = nullptr; // set to nullptr if aborted.

			// in
			std::vector<Address> m_vAddresses;

			// out. Either one object per address, or a transport error
			std::vector<ObjectData> m_vObjects;
			std::string m_TransportError;

			bool IsTransportOk() const;
		};

		virtual ~ILedgerReader() {}

		// Max addresses per request the client accepts
		virtual uint32_t get_MaxBatch() const { return 50; }

		// Completion must be delivered asynchronously, not from within this call.
		// Timeouts and retries are the client's business, a final failure is reported via m_TransportError.
		virtual void PostRequestInternal(Request&) = 0;

		void PostRequest(Request&, Request::IHandler&);
	};

} // namespace verifier
} // namespace srcverify
