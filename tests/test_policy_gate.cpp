#include <QtTest/QtTest>

#include "../src/core/policy/PolicyGate.hpp"

using namespace Enclave;

class TestPolicyGate : public QObject {
    Q_OBJECT

private:
    PolicyGate gate_;

private slots:
    void testAcceptsAllowedImports() {
        const AllowListVerdict verdict = gate_.validate(
            "import json\n"
            "import numpy as np\n"
            "import os.path\n"
            "from collections import Counter\n"
            "from xml.etree import ElementTree as ET\n"
            "print(json.dumps({'n': np.pi}))\n");

        QVERIFY(verdict.accepted);
        QVERIFY(verdict.kind == AllowListVerdict::Kind::Accepted);
        QVERIFY(verdict.violations.isEmpty());
        QVERIFY(verdict.message.isEmpty());
    }

    void testAcceptsSnippetWithoutImports() {
        QVERIFY(gate_.validate("print(2+2)").accepted);
        QVERIFY(gate_.validate("").accepted);
        QVERIFY(gate_.validate("# only a comment\n").accepted);
    }

    void testAcceptsParameterMarkers() {
        const AllowListVerdict verdict = gate_.validate(
            "def f(a, /, b): pass\n"
            "def g(a, /): pass\n"
            "import json\n");
        QVERIFY(verdict.accepted);

        const AllowListVerdict blocked = gate_.validate("def f(a, /, b): pass\nimport torch\n");
        QVERIFY(blocked.kind == AllowListVerdict::Kind::PolicyViolation);
        QCOMPARE(blocked.violations, QStringList({"torch"}));
    }

    void testRejectsDisallowedImport() {
        const AllowListVerdict verdict = gate_.validate("import requests\n");

        QVERIFY(!verdict.accepted);
        QVERIFY(verdict.kind == AllowListVerdict::Kind::PolicyViolation);
        QCOMPARE(verdict.violations, QStringList({"requests"}));
        QVERIFY(verdict.message.startsWith(
            "Import restriction violation: The following imports are not allowed: requests\n\n"));
        QVERIFY(verdict.message.contains("Allowed libraries:"));
    }

    void testMixedImportsReportOnlyDisallowed() {
        const AllowListVerdict verdict = gate_.validate("import json\nimport torch\n");

        QVERIFY(!verdict.accepted);
        QCOMPARE(verdict.violations, QStringList({"torch"}));
    }

    void testViolationsAreSortedAndUnique() {
        const AllowListVerdict verdict = gate_.validate(
            "import torch\n"
            "import requests, torch\n"
            "from boto3.session import Session\n");

        QCOMPARE(verdict.violations, QStringList({"boto3.session", "requests", "torch"}));
        QVERIFY(verdict.message.contains("boto3.session, requests, torch"));
    }

    void testAliasDoesNotHideModule() {
        const AllowListVerdict verdict = gate_.validate("import requests as json\n");
        QCOMPARE(verdict.violations, QStringList({"requests"}));
    }

    void testSubmoduleChecksTopLevelSegment() {
        QVERIFY(gate_.validate("import matplotlib.pyplot as plt\n").accepted);

        const AllowListVerdict verdict = gate_.validate("from urllib3.util import retry\n");
        QCOMPARE(verdict.violations, QStringList({"urllib3.util"}));
    }

    void testNestedImportsAreFound() {
        const AllowListVerdict verdict = gate_.validate(
            "def fetch():\n"
            "    if True:\n"
            "        import requests\n"
            "    return 1\n"
            "try:\n"
            "    import torch\n"
            "except ImportError:\n"
            "    pass\n");

        QCOMPARE(verdict.violations, QStringList({"requests", "torch"}));
    }

    void testImportsInsideStringsIgnored() {
        QVERIFY(gate_.validate("text = 'import requests'\ndoc = \"\"\"\nimport torch\n\"\"\"\n").accepted);
    }

    void testRelativeImportsRejectedByDefault() {
        const AllowListVerdict verdict = gate_.validate("from . import helpers\nfrom ..json import x\n");

        QVERIFY(verdict.kind == AllowListVerdict::Kind::PolicyViolation);
        QCOMPARE(verdict.violations, QStringList({".", "..json"}));
    }

    void testRelativeImportsWhenAllowed() {
        AllowList list = AllowList::defaults();
        list.setAllowRelativeImports(true);
        const PolicyGate gate(list);

        QVERIFY(gate.validate("from . import helpers\n").accepted);
        QVERIFY(gate.validate("from .json import loads\n").accepted);
        QCOMPARE(gate.validate("from .requests import get\n").violations, QStringList({"requests"}));
    }

    void testDynamicImportDetection() {
        const AllowListVerdict verdict = gate_.validate("mod = __import__('socket')\n");
        QVERIFY(verdict.kind == AllowListVerdict::Kind::PolicyViolation);
        QCOMPARE(verdict.violations, QStringList({"__import__"}));

        AllowList list = AllowList::defaults();
        list.setDetectDynamicImports(false);
        QVERIFY(PolicyGate(list).validate("mod = __import__('socket')\n").accepted);
    }

    void testSyntaxErrorReported() {
        const AllowListVerdict verdict = gate_.validate("import json\nif True\n    print(1)\n");

        QVERIFY(!verdict.accepted);
        QVERIFY(verdict.kind == AllowListVerdict::Kind::ParseError);
        QVERIFY(verdict.violations.isEmpty());
        QVERIFY(verdict.message.startsWith("Syntax error in code: "));
        QCOMPARE(verdict.line, 2);
    }

    void testSyntaxErrorWinsOverViolations() {
        const AllowListVerdict verdict = gate_.validate("import requests\nprint('unterminated\n");
        QVERIFY(verdict.kind == AllowListVerdict::Kind::ParseError);
        QVERIFY(verdict.message.contains("unterminated string literal"));
    }

    void testCustomAllowList() {
        AllowList list;
        list.setPermitted("sympy", true);
        const PolicyGate gate(list);

        QVERIFY(gate.validate("import sympy\n").accepted);
        const AllowListVerdict verdict = gate.validate("import os\n");
        QCOMPARE(verdict.violations, QStringList({"os"}));
        QVERIFY(verdict.message.endsWith("Allowed libraries:\n- sympy"));
        QVERIFY(gate.allowList().permits("sympy"));
    }
};

int runTestPolicyGate(int argc, char** argv) {
    TestPolicyGate test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_policy_gate.moc"
