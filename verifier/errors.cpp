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


#include "errors.h"
#include <sstream>

namespace srcverify {
namespace verifier {

	namespace
	{
		struct Printer
		{
			std::ostream& m_os;

			void operator()(const Err::ZeroOnChainAddressSpecified&) const
			{
			}

			void operator()(const Err::InvalidModule& x) const
			{
				m_os << ": " << x.m_Module << ": " << x.m_Message;
			}

			void operator()(const Err::ObjectRefFailure& x) const
			{
				m_os << ": " << x.m_Detail;
			}

			void operator()(const Err::ObjectFoundWhenPackageExpected& x) const
			{
				m_os << ": " << x.m_Address << " (" << x.m_Description << ")";
			}

			void operator()(const Err::OnChainDependencyNotFound& x) const
			{
				m_os << ": " << x.m_Package << "::" << x.m_Module;
			}

			void operator()(const Err::LocalDependencyNotFound& x) const
			{
				m_os << ": " << x.m_Address << "::" << x.m_Module;
			}

			void operator()(const Err::ModuleBytecodeMismatch& x) const
			{
				m_os << ": " << x.m_Package << "::" << x.m_Module << " at " << x.m_Address;
			}

			void operator()(const Err::DependencyObjectReadFailure& x) const
			{
				m_os << ": " << x.m_Detail;
			}
		};
	}

	const char* VerificationError::get_KindName(Kind k)
	{
		switch (k)
		{
#define THE_MACRO(name, descr) case Kind::name: return #name;
			SRCVERIFY_VERIFICATION_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
		default:
			return "Unknown";
		}
	}

	const char* VerificationError::get_KindDescription(Kind k)
	{
		switch (k)
		{
#define THE_MACRO(name, descr) case Kind::name: return descr;
			SRCVERIFY_VERIFICATION_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
		default:
			return "unknown error";
		}
	}

	std::string VerificationError::str() const
	{
		std::ostringstream os;
		os << *this;
		return os.str();
	}

	std::ostream& operator << (std::ostream& os, const VerificationError& e)
	{
		os << VerificationError::get_KindDescription(e.get_Kind());
		std::visit(Printer{ os }, e.get_Variant());
		return os;
	}

	std::ostream& operator << (std::ostream& os, const VerificationResult& r)
	{
		if (r.IsOk())
			return os << "ok";

		os << *r.get_First();
		if (r.m_vErrors.size() > 1)
			os << " (+" << (r.m_vErrors.size() - 1) << " more)";
		return os;
	}

} // namespace verifier
} // namespace srcverify
