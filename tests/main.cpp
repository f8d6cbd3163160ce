#include "jbsync_test_harness.hpp"
#include "jbsync_tokens_tests.hpp"
#include "jbsync_patcher_tests.hpp"
#include "jbsync_naming_tests.hpp"
#include "jbsync_entities_tests.hpp"
#include "jbsync_table_editor_tests.hpp"
#include "jbsync_reconciler_tests.hpp"
#include "jbsync_gate_tests.hpp"
#include "jbsync_session_tests.hpp"

#include "../include/jbsync_log.hpp"

#include <iostream>

namespace jbsync::tests 
{
    std::vector<test_result> results;    
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace jbsync::tests;

    // Expected warnings would drown the report
    jbsync::log::init(spdlog::level::off);

    #ifdef JBSYNC_TESTS_TOKENS__ 
        run_tests("Token stream", run_tokens_tests); 
    #endif

    #ifdef JBSYNC_TESTS_PATCHER__ 
        run_tests("Leaf value patcher", run_patcher_tests);
    #endif

    #ifdef JBSYNC_TESTS_NAMING__ 
        run_tests("Naming and options", run_naming_tests);
    #endif

    #ifdef JBSYNC_TESTS_ENTITIES__ 
        run_tests("Entity tables", run_entities_tests);
    #endif

    #ifdef JBSYNC_TESTS_TABLE_EDITOR__ 
        run_tests("Table editor", run_table_editor_tests);
    #endif

    #ifdef JBSYNC_TESTS_RECONCILER__ 
        run_tests("Entity reconciler", run_reconciler_tests);
    #endif

    #ifdef JBSYNC_TESTS_GATE__ 
        run_tests("Confirmation gate", run_gate_tests);
    #endif

    #ifdef JBSYNC_TESTS_SESSION__ 
        run_tests("Export session", run_session_tests);
    #endif

    size_t failed = std::count_if(results.begin(), results.end(),
        [](test_result const & r) { return !r.passed; });

    std::cout << '\n' << results.size() - failed << '/' << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
