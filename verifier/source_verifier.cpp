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


#include "source_verifier.h"
#include "package_resolver.h"
#include "dependency_walker.h"
#include "bytecode_comparator.h"
#include "../core/module_binary.h"
#include "../utility/config.h"
#include "../utility/logger.h"
#include <assert.h>

namespace srcverify {
namespace verifier {

	void SourceVerifier::Settings::Load(const Config& cfg)
	{
		m_FailFast = cfg.get_bool("verifier.fail_fast", m_FailFast);
		m_MaxInFlight = static_cast<uint32_t>(cfg.get_int("verifier.max_inflight", static_cast<int>(m_MaxInFlight), 1, 1024));
		m_Verbose = cfg.get_bool("verifier.verbose", m_Verbose);
	}

	SourceVerifier::SourceVerifier(ILedgerReader& r, const Settings& s)
		:m_Reader(r)
		,m_Settings(s)
	{
	}

	struct SourceVerifier::JobImpl
		:public Job
		,public PackageResolver::IHandler
	{
		// One package to compare. Tasks are ordered: published dependencies by address, then the root
		struct Task
		{
			BytecodeComparator::Input m_Input;
			bool m_Done = false;
			std::vector<VerificationError> m_vErrors;
		};

		Settings m_Settings;
		Callback m_Callback;
		PackageResolver m_Resolver;
		DependencyClosure m_Closure;
		std::vector<Task> m_vTasks;
		std::map<Address, std::vector<size_t> > m_mapWaiting;
		bool m_Done = false;

		JobImpl(ILedgerReader& r, const Settings& s, Callback&& cb)
			:m_Settings(s)
			,m_Callback(std::move(cb))
			,m_Resolver(r, s.m_MaxInFlight)
		{
		}

		void Cancel() override
		{
			if (m_Done)
				return;

			LOG_MESSAGE(m_Settings.get_TraceLevel()) << "verifier: job cancelled, " << m_mapWaiting.size() << " address(es) pending";
			m_Done = true;
			m_Resolver.Abort();
			m_Callback = nullptr;
		}

		bool IsDone() const override
		{
			return m_Done;
		}

		BytecodeComparator::Policy get_Policy() const
		{
			return m_Settings.m_FailFast ? BytecodeComparator::Policy::FirstOnly : BytecodeComparator::Policy::All;
		}

		void AddTask(const std::string& sPackage, const Address& addr, std::vector<const CompiledModule*>&& vLocal)
		{
			Task& t = m_vTasks.emplace_back();
			t.m_Input.m_Package = sPackage;
			t.m_Input.m_Address = addr;
			t.m_Input.m_vLocal = std::move(vLocal);
		}

		void Start(const CompiledPackage& pkg, bool bDeps, const Address* pRoot)
		{
			m_Closure = DependencyWalker::Walk(pkg);

			if (bDeps)
			{
				for (const auto& dp : m_Closure.m_vPublished)
					AddTask(dp.m_Name, dp.m_Address, std::vector<const CompiledModule*>(dp.m_vModules));
			}

			if (pRoot)
			{
				// bundled modules were published as a part of the root
				std::vector<const CompiledModule*> vLocal;
				for (const auto& m : pkg.m_vModules)
					vLocal.push_back(&m);

				for (const auto* pModule : m_Closure.m_vBundled)
					if (!pkg.FindModule(pModule->m_Name))
						vLocal.push_back(pModule);

				AddTask(pkg.m_Name, *pRoot, std::move(vLocal));
			}

			LOG_MESSAGE(m_Settings.get_TraceLevel()) << "verifier: " << pkg.m_Name << ", " << m_vTasks.size() << " package(s) to compare";

			std::vector<VerificationError> vErrs;
			if (!ValidateLocal(vErrs))
			{
				Finish(std::move(vErrs));
				return;
			}

			if (m_vTasks.empty())
			{
				Finish(std::move(vErrs));
				return;
			}

			std::vector<Address> vAddrs;
			for (size_t i = 0; i < m_vTasks.size(); i++)
			{
				const Address& addr = m_vTasks[i].m_Input.m_Address;
				auto& v = m_mapWaiting[addr];
				if (v.empty())
					vAddrs.push_back(addr);
				v.push_back(i);
			}

			if (!m_Resolver.Resolve(std::move(vAddrs), *this))
			{
				vErrs.emplace_back(Err::ZeroOnChainAddressSpecified());
				Finish(std::move(vErrs));
			}
		}

		bool ValidateLocal(std::vector<VerificationError>& vErrs) const
		{
			ModuleBinary mb;

			for (const auto& t : m_vTasks)
			{
				for (const auto* pModule : t.m_Input.m_vLocal)
				{
					try {
						mb.Load(pModule->m_Bytes);
						if (mb.get_Name() != pModule->m_Name)
							throw ModuleFormatError("module name mismatch: " + mb.get_Name());
					}
					catch (const ModuleFormatError& e) {
						vErrs.emplace_back(Err::InvalidModule{ pModule->m_Name, e.what() });
						if (m_Settings.m_FailFast)
							return false;
					}
				}
			}

			return vErrs.empty();
		}

		struct Evaluator
		{
			Task& m_Task;
			BytecodeComparator::Policy m_Policy;

			void operator()(const OnChain::Package& p) const
			{
				BytecodeComparator::Compare(m_Task.m_Input, p, m_Policy, m_Task.m_vErrors);
			}

			void operator()(const OnChain::NonPackageObject& x) const
			{
				m_Task.m_vErrors.emplace_back(Err::ObjectFoundWhenPackageExpected{ x.m_Address, x.m_Description });
			}

			void operator()(const OnChain::NotFound& x) const
			{
				m_Task.m_vErrors.emplace_back(Err::ObjectRefFailure{ x.m_Detail });
			}
		};

		void OnResolved(std::vector<PackageResolver::Resolved>&& vRes) override
		{
			for (const auto& r : vRes)
			{
				auto it = m_mapWaiting.find(r.m_Address);
				if (m_mapWaiting.end() == it)
					continue; // not requested

				for (size_t iTask : it->second)
				{
					Task& t = m_vTasks[iTask];
					std::visit(Evaluator{ t, get_Policy() }, r.m_Data);
					t.m_Done = true;

					LOG_MESSAGE(m_Settings.get_DetailLevel()) << "verifier: " << t.m_Input.m_Package << " at " << t.m_Input.m_Address << (t.m_vErrors.empty() ? " ok" : " failed");
				}

				m_mapWaiting.erase(it);
			}

			TryFinish();
		}

		void OnReadFailure(const std::string& sErr) override
		{
			std::vector<VerificationError> vErrs;
			vErrs.emplace_back(Err::DependencyObjectReadFailure{ sErr });
			Finish(std::move(vErrs));
		}

		void TryFinish()
		{
			std::vector<VerificationError> vErrs;

			if (m_Settings.m_FailFast)
			{
				// the earliest failure in task order wins, no matter in which order the lookups complete
				for (const auto& t : m_vTasks)
				{
					if (!t.m_Done)
						return;

					if (!t.m_vErrors.empty())
					{
						vErrs.push_back(t.m_vErrors.front());
						break;
					}
				}
			}
			else
			{
				if (!m_mapWaiting.empty())
					return;

				for (const auto& t : m_vTasks)
					vErrs.insert(vErrs.end(), t.m_vErrors.begin(), t.m_vErrors.end());
			}

			Finish(std::move(vErrs));
		}

		// Must be the last action: the callback may destroy this
		void Finish(std::vector<VerificationError>&& vErrs)
		{
			assert(!m_Done);
			m_Done = true;
			m_Resolver.Abort();

			VerificationResult res;
			res.m_vErrors = std::move(vErrs);

			LOG_MESSAGE(m_Settings.get_TraceLevel()) << "verifier: done, " << res;

			Callback cb;
			cb.swap(m_Callback);
			if (cb)
				cb(std::move(res));
		}
	};

	SourceVerifier::Job::Ptr SourceVerifier::Start(const CompiledPackage& pkg, bool bDeps, const Address* pRoot, Callback&& cb)
	{
		std::unique_ptr<JobImpl> pJob = std::make_unique<JobImpl>(m_Reader, m_Settings, std::move(cb));
		pJob->Start(pkg, bDeps, pRoot);
		return pJob;
	}

	namespace
	{
		struct RejectedJob
			:public SourceVerifier::Job
		{
			void Cancel() override {}
			bool IsDone() const override { return true; }
		};

		SourceVerifier::Job::Ptr FinishNow(VerificationError&& err, const SourceVerifier::Settings& s, const SourceVerifier::Callback& cb)
		{
			VerificationResult res;
			res.m_vErrors.push_back(std::move(err));

			LOG_MESSAGE(s.get_TraceLevel()) << "verifier: rejected, " << res;

			if (cb)
				cb(std::move(res));
			return std::make_unique<RejectedJob>();
		}
	}

	SourceVerifier::Job::Ptr SourceVerifier::VerifyPackageDeps(const CompiledPackage& pkg, Callback cb)
	{
		return Start(pkg, true, nullptr, std::move(cb));
	}

	SourceVerifier::Job::Ptr SourceVerifier::VerifyPackageRoot(const CompiledPackage& pkg, const Address& addr, Callback cb)
	{
		if (addr.IsPlaceholder())
			return FinishNow(Err::ZeroOnChainAddressSpecified(), m_Settings, cb);

		return Start(pkg, false, &addr, std::move(cb));
	}

	SourceVerifier::Job::Ptr SourceVerifier::VerifyPackageRootAndDeps(const CompiledPackage& pkg, const Address& addr, Callback cb)
	{
		if (addr.IsPlaceholder())
			return FinishNow(Err::ZeroOnChainAddressSpecified(), m_Settings, cb);

		return Start(pkg, true, &addr, std::move(cb));
	}

	SourceVerifier::Job::Ptr SourceVerifier::VerifyPackage(const CompiledPackage& pkg, bool bVerifyDeps, SourceMode eMode, Callback cb)
	{
		if (SourceMode::Skip == eMode)
			return Start(pkg, bVerifyDeps, nullptr, std::move(cb));

		std::string sModule;
		if (!pkg.CheckConsistency(&sModule))
			return FinishNow(Err::InvalidModule{ sModule, "declared address does not match the package address" }, m_Settings, cb);

		Address addr = pkg.get_SelfAddress();
		if (addr.IsPlaceholder())
		{
			sModule = pkg.m_vModules.empty() ? pkg.m_Name : pkg.m_vModules.front().m_Name;
			return FinishNow(Err::InvalidModule{ sModule, "cannot verify unpublished source" }, m_Settings, cb);
		}

		return Start(pkg, bVerifyDeps, &addr, std::move(cb));
	}

} // namespace verifier
} // namespace srcverify
