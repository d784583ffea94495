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


#include "verifier/bytecode_comparator.h"
#include "test_helpers.h"
#include "fixtures.h"

VERIFIER_TEST_INIT

using namespace srcverify;
using namespace srcverify::verifier;
using namespace srcverify::verifier::test;

namespace
{
    const Address g_AddrB = Address::FromOrdinal(0xb0U);

    // what the ledger holds after b was compiled against the placeholder and published at g_AddrB
    OnChain::Package PublishB(const Sources& src = Sources())
    {
        auto pB = CompileB({}, src);

        OnChain::Package ret;
        for (const auto& m : pB->m_vModules)
            SubstituteAddress(m.m_Bytes, Address(Zero), g_AddrB, ret.m_Modules[m.m_Name]);
        return ret;
    }

    BytecodeComparator::Input MakeInput(const CompiledPackage& pkg)
    {
        BytecodeComparator::Input inp;
        inp.m_Package = pkg.m_Name;
        inp.m_Address = g_AddrB;
        for (const auto& m : pkg.m_vModules)
            inp.m_vLocal.push_back(&m);
        return inp;
    }

    void TestMatch()
    {
        OnChain::Package onChain = PublishB();
        std::vector<VerificationError> vErrs;

        // compiled against the real address
        auto pB = CompileB({ { "b", g_AddrB } });
        VERIFIER_CHECK(BytecodeComparator::Compare(MakeInput(*pB), onChain, BytecodeComparator::Policy::All, vErrs));

        // compiled against the placeholder, normalized
        pB = CompileB({});
        VERIFIER_CHECK(BytecodeComparator::Compare(MakeInput(*pB), onChain, BytecodeComparator::Policy::All, vErrs));
        VERIFIER_CHECK(vErrs.empty());
    }

    void TestNormalizationRequired()
    {
        OnChain::Package onChain = PublishB();
        auto pB = CompileB({});

        // raw placeholder bytes differ from the published ones
        for (const auto& m : pB->m_vModules)
            VERIFIER_CHECK(m.m_Bytes != onChain.m_Modules[m.m_Name]);

        // normalizing against a wrong address fails for every module
        BytecodeComparator::Input inp = MakeInput(*pB);
        inp.m_Address = Address::FromOrdinal(0xbadU);

        std::vector<VerificationError> vErrs;
        VERIFIER_CHECK(!BytecodeComparator::Compare(inp, onChain, BytecodeComparator::Policy::All, vErrs));
        VERIFIER_CHECK(vErrs.size() == 2);
        for (const auto& e : vErrs)
            VERIFIER_CHECK(e.Is<Err::ModuleBytecodeMismatch>());
    }

    void TestMissingModules()
    {
        Sources srcNoD;
        srcNoD.m_WithModuleD = false;

        // local tree lacks d
        {
            auto pB = CompileB({}, srcNoD);
            std::vector<VerificationError> vErrs;
            VERIFIER_CHECK(!BytecodeComparator::Compare(MakeInput(*pB), PublishB(), BytecodeComparator::Policy::All, vErrs));
            VERIFIER_CHECK(vErrs.size() == 1);

            auto* p = vErrs[0].As<Err::LocalDependencyNotFound>();
            VERIFIER_CHECK(p && (p->m_Module == "d") && (p->m_Address == g_AddrB));
        }

        // chain lacks d
        {
            auto pB = CompileB({});
            std::vector<VerificationError> vErrs;
            VERIFIER_CHECK(!BytecodeComparator::Compare(MakeInput(*pB), PublishB(srcNoD), BytecodeComparator::Policy::All, vErrs));
            VERIFIER_CHECK(vErrs.size() == 1);

            auto* p = vErrs[0].As<Err::OnChainDependencyNotFound>();
            VERIFIER_CHECK(p && (p->m_Module == "d") && (p->m_Package == "b"));
        }
    }

    void TestPolicy()
    {
        Sources src;
        src.m_ConstC = 44;
        src.m_WithModuleD = false;

        // c differs, d is missing locally. Errors come in module-name order
        auto pB = CompileB({}, src);
        std::vector<VerificationError> vErrs;
        VERIFIER_CHECK(!BytecodeComparator::Compare(MakeInput(*pB), PublishB(), BytecodeComparator::Policy::All, vErrs));
        VERIFIER_CHECK(vErrs.size() == 2);
        VERIFIER_CHECK(vErrs[0].Is<Err::ModuleBytecodeMismatch>());
        VERIFIER_CHECK(vErrs[1].Is<Err::LocalDependencyNotFound>());

        auto* p = vErrs[0].As<Err::ModuleBytecodeMismatch>();
        VERIFIER_CHECK(p && (p->m_Package == "b") && (p->m_Module == "c") && (p->m_Address == g_AddrB));

        vErrs.clear();
        VERIFIER_CHECK(!BytecodeComparator::Compare(MakeInput(*pB), PublishB(), BytecodeComparator::Policy::FirstOnly, vErrs));
        VERIFIER_CHECK(vErrs.size() == 1);
        VERIFIER_CHECK(vErrs[0].Is<Err::ModuleBytecodeMismatch>());
    }

    void TestMalformed()
    {
        CompiledPackage pkg = *CompileB({});
        pkg.m_vModules[0].m_Bytes.resize(3);

        std::vector<VerificationError> vErrs;
        VERIFIER_CHECK(!BytecodeComparator::Compare(MakeInput(pkg), PublishB(), BytecodeComparator::Policy::All, vErrs));
        VERIFIER_CHECK(vErrs.size() == 1);

        auto* p = vErrs[0].As<Err::InvalidModule>();
        VERIFIER_CHECK(p && (p->m_Module == "c") && !p->m_Message.empty());
    }

    void TestErrorText()
    {
        VerificationError e = Err::ModuleBytecodeMismatch{ g_AddrB, "b", "c" };
        VERIFIER_CHECK(e.get_Kind() == VerificationError::Kind::ModuleBytecodeMismatch);

        std::string s = e.str();
        VERIFIER_CHECK(s.find(g_AddrB.str()) != std::string::npos);
        VERIFIER_CHECK(s.find("b::c") != std::string::npos);

        VerificationError e2 = e;
        VERIFIER_CHECK(e2.Is<Err::ModuleBytecodeMismatch>());

        VERIFIER_CHECK(std::string(VerificationError::get_KindName(VerificationError::Kind::ZeroOnChainAddressSpecified)) == "ZeroOnChainAddressSpecified");
    }
}

int main()
{
    TestMatch();
    TestNormalizationRequired();
    TestMissingModules();
    TestPolicy();
    TestMalformed();
    TestErrorText();

    return VERIFIER_CHECK_RESULT;
}
