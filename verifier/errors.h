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
#include "../core/address.h"
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace srcverify {
namespace verifier {

#define SRCVERIFY_VERIFICATION_ERROR_MAP(macro) \
	macro(ZeroOnChainAddressSpecified,    "zero address specified as the on-chain verification target") \
	macro(InvalidModule,                  "module cannot be verified") \
	macro(ObjectRefFailure,               "could not find object reference") \
	macro(ObjectFoundWhenPackageExpected, "object found where package expected") \
	macro(OnChainDependencyNotFound,      "local module not found on-chain") \
	macro(LocalDependencyNotFound,        "on-chain module not found locally") \
	macro(ModuleBytecodeMismatch,         "local module bytecode does not match on-chain") \
	macro(DependencyObjectReadFailure,    "failed to read dependency object")

	namespace Err
	{
		struct ZeroOnChainAddressSpecified {
		};

		struct InvalidModule {
			std::string m_Module;
			std::string m_Message;
		};

		struct ObjectRefFailure {
			std::string m_Detail;
		};

		struct ObjectFoundWhenPackageExpected {
			Address m_Address;
			std::string m_Description;
		};

		struct OnChainDependencyNotFound {
			std::string m_Package;
			std::string m_Module;
		};

		struct LocalDependencyNotFound {
			Address m_Address;
			std::string m_Module;
		};

		struct ModuleBytecodeMismatch {
			Address m_Address;
			std::string m_Package;
			std::string m_Module;
		};

		struct DependencyObjectReadFailure {
			std::string m_Detail;
		};
	}

	class VerificationError
	{
	public:
		enum struct Kind {
#define THE_MACRO(name, descr) name,
			SRCVERIFY_VERIFICATION_ERROR_MAP(THE_MACRO)
#undef THE_MACRO
			count
		};

		typedef std::variant<
			Err::ZeroOnChainAddressSpecified,
			Err::InvalidModule,
			Err::ObjectRefFailure,
			Err::ObjectFoundWhenPackageExpected,
			Err::OnChainDependencyNotFound,
			Err::LocalDependencyNotFound,
			Err::ModuleBytecodeMismatch,
			Err::DependencyObjectReadFailure
		> Variant;

		static_assert(std::variant_size_v<Variant> == static_cast<size_t>(Kind::count));

		template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, VerificationError> > >
		VerificationError(T&& x) :m_Value(std::forward<T>(x)) {}

		Kind get_Kind() const { return static_cast<Kind>(m_Value.index()); }

		template <typename T>
		const T* As() const { return std::get_if<T>(&m_Value); }

		template <typename T>
		bool Is() const { return std::holds_alternative<T>(m_Value); }

		const Variant& get_Variant() const { return m_Value; }

		std::string str() const;

		static const char* get_KindName(Kind);
		static const char* get_KindDescription(Kind);

	private:
		Variant m_Value;
	};

	std::ostream& operator << (std::ostream&, const VerificationError&);

	struct VerificationResult
	{
		// In fail-fast mode holds at most one error. Otherwise all of them, in verification order
		std::vector<VerificationError> m_vErrors;

		bool IsOk() const { return m_vErrors.empty(); }

		// the top-level outcome, nullptr on success
		const VerificationError* get_First() const
		{
			return m_vErrors.empty() ? nullptr : &m_vErrors.front();
		}
	};

	std::ostream& operator << (std::ostream&, const VerificationResult&);

} // namespace verifier
} // namespace srcverify
