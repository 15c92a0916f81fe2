/*##############################################################################

    HPCC SYSTEMS software Copyright (C) 2026 HPCC Systems®.

    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
############################################################################## */

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <cppunit/TestRunner.h>
#include <cppunit/ui/text/TestRunner.h>
#include <cppunit/extensions/HelperMacros.h>
#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/TestResult.h>
#include <cppunit/TestFailure.h>
#include <cppunit/TestResultCollector.h>

#include "Log.hpp"

using namespace hadoopDeploy;


class DeployTestProgressListener : public CPPUNIT_NS::TestListener
{
public:
    DeployTestProgressListener() : m_lastTestFailed(false) {}
    virtual ~DeployTestProgressListener() {}

    void startTest(CPPUNIT_NS::Test *test)
    {
        PROGLOG("TEST(%s): START", test->getName().c_str());
        m_lastTestFailed = false;
    }

    void addFailure(const CPPUNIT_NS::TestFailure &failure)
    {
        std::string s = "TEST(" + failure.failedTestName() + "): " + (failure.isError() ? "" : "ASSERT ") +
                        "File: " + failure.sourceLine().fileName() + " Ln:" + std::to_string(failure.sourceLine().lineNumber());
        CPPUNIT_NS::Exception *e = failure.thrownException();
        if (e)
            s += " " + e->message().shortDescription() + " " + e->message().details();
        OERRLOG("%s", s.c_str());
        m_lastTestFailed = true;
    }

    void endTest(CPPUNIT_NS::Test *test)
    {
        PROGLOG("TEST(%s): END%s", test->getName().c_str(), m_lastTestFailed ? "" : " OK");
    }

private:
    DeployTestProgressListener(const DeployTestProgressListener &copy);
    void operator =(const DeployTestProgressListener &copy);

private:
    bool m_lastTestFailed;
};


static void usage()
{
    printf("usage: unittests [-v] [-log <file>] [<suite name>...]\n");
}


int main(int argc, char **argv)
{
    bool verbose = false;
    std::string logFile;
    std::vector<std::string> suites;
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-v") == 0)
            verbose = true;
        else if (strcmp(argv[i], "-log") == 0 && i + 1 < argc)
            logFile = argv[++i];
        else if (argv[i][0] == '-')
        {
            usage();
            return 1;
        }
        else
            suites.push_back(argv[i]);
    }
    initLogging(logFile, verbose);

    CPPUNIT_NS::TestResult controller;

    CPPUNIT_NS::TestResultCollector result;
    controller.addListener(&result);

    DeployTestProgressListener progress;
    controller.addListener(&progress);

    CPPUNIT_NS::TestRunner runner;
    if (suites.empty())
        runner.addTest(CPPUNIT_NS::TestFactoryRegistry::getRegistry().makeTest());
    else
    {
        for (auto it = suites.begin(); it != suites.end(); ++it)
            runner.addTest(CPPUNIT_NS::TestFactoryRegistry::getRegistry(*it).makeTest());
    }
    runner.run(controller);

    return result.wasSuccessful() ? 0 : 1;
}
