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
#include "errors.h"
#include "ledger_reader.h"
#include "../utility/logger.h"
#include <functional>

namespace srcverify {

class Config;

namespace verifier {

	// Checks that compiled local sources correspond to what is published on-chain.
	// Verification is read-only: the only side effect is ledger reads through ILedgerReader.
	class SourceVerifier
	{
	public:
		struct Settings
		{
			bool m_FailFast = true; // report only the first error, in task order
			uint32_t m_MaxInFlight = 8; // max outstanding ledger requests per job
			bool m_Verbose = false; // job progress at info level instead of debug

			Settings();

			int get_TraceLevel() const { return m_Verbose ? LOG_LEVEL_INFO : LOG_LEVEL_DEBUG; }
			int get_DetailLevel() const { return m_Verbose ? LOG_LEVEL_INFO : LOG_LEVEL_VERBOSE; }

			void Load(const Config&);
		};

		enum struct SourceMode {
			Skip,
			Verify, // use the address embedded in the compiled root
		};

		typedef std::function<void(VerificationResult&&)> Callback;

		class Job
		{
		public:
			typedef std::unique_ptr<Job> Ptr;

			virtual ~Job() {}

			// Abandons all outstanding lookups. The callback won't be invoked
			virtual void Cancel() = 0;

			virtual bool IsDone() const = 0;
		};

		SourceVerifier(ILedgerReader&, const Settings& = Settings());

		const Settings& get_Settings() const { return m_Settings; }

		// The package must stay alive until the job is done or destroyed.
		// Errors detected before any lookup is made are reported from within the call.
		// The job may be destroyed from within the callback.

		Job::Ptr VerifyPackageDeps(const CompiledPackage&, Callback);
		Job::Ptr VerifyPackageRoot(const CompiledPackage&, const Address&, Callback);
		Job::Ptr VerifyPackageRootAndDeps(const CompiledPackage&, const Address&, Callback);
		Job::Ptr VerifyPackage(const CompiledPackage&, bool bVerifyDeps, SourceMode, Callback);

	private:
		struct JobImpl;

		Job::Ptr Start(const CompiledPackage&, bool bDeps, const Address* pRoot, Callback&&);

		ILedgerReader& m_Reader;
		Settings m_Settings;
	};

	inline SourceVerifier::Settings::Settings() = default;

} // namespace verifier
} // namespace srcverify
