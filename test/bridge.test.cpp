#define BOOST_TEST_MODULE Bridge Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "glua/glua.hpp"

#include <stdexcept>

using namespace glua;

static value_list run_ok(vm_state& S, const string& code) {
    auto r = run(std::move(S), code);
    BOOST_REQUIRE_MESSAGE(r.ok(), (r.ok() ? "" : r.error().describe()));
    auto st = r.take();
    S = std::move(st.state);
    return std::move(st.out);
}

// expose fn and bind it to a global name
static void expose_as(vm_state& S, const string& name, host_function fn) {
    auto e = expose(std::move(S), std::move(fn));
    auto r = set(std::move(e.state), {name}, e.out);
    BOOST_REQUIRE(r.ok());
    S = r.take();
}

static value_list call_ok(vm_state& S, const key_path& keys, const value_list& args) {
    auto r = call_by_name(std::move(S), keys, args);
    BOOST_REQUIRE_MESSAGE(r.ok(), (r.ok() ? "" : r.error().describe()));
    auto st = r.take();
    S = std::move(st.state);
    return std::move(st.out);
}

static step<value_list> no_values(vm_state&& s) {
    return step<value_list>{value_list{}, std::move(s)};
}

BOOST_AUTO_TEST_CASE( expose_test ) {
    auto S = init();
    expose_as(S, "negate", [](vm_state&& s, value_list args) {
        return step<value_list>{value_list{value{-args.at(0).as_int()}}, std::move(s)};
    });

    auto vs = run_ok(S, "return negate(5)");
    BOOST_TEST(vs.at(0).as_int() == -5);

    // the host closure is an ordinary guest function
    vs = run_ok(S, "return type(negate)");
    BOOST_TEST(vs.at(0).as_string() == "function");

    vs = call_ok(S, {"negate"}, {value{i64{8}}});
    BOOST_TEST(vs.at(0).as_int() == -8);
}

BOOST_AUTO_TEST_CASE( host_arguments_test ) {
    auto S = init();
    expose_as(S, "describe", [](vm_state&& s, value_list args) {
        value_list out;
        out.push_back(value{static_cast<i64>(args.size())});
        for (auto& a : args) {
            out.push_back(value{tag_name(a.tag())});
        }
        return step<value_list>{std::move(out), std::move(s)};
    });
    auto vs = run_ok(S, "return describe(1, nil, 2.5, 'x', {}, print)");
    BOOST_REQUIRE(vs.size() == 7);
    BOOST_TEST(vs[0].as_int() == 6);
    BOOST_TEST(vs[1].as_string() == "integer");
    BOOST_TEST(vs[2].as_string() == "nil");
    BOOST_TEST(vs[3].as_string() == "float");
    BOOST_TEST(vs[4].as_string() == "string");
    BOOST_TEST(vs[5].as_string() == "table");
    BOOST_TEST(vs[6].as_string() == "function");

    // tables arrive by reference and can be read in the closure
    expose_as(S, "count", [](vm_state&& s, value_list args) {
        auto entries = table_entries(args.at(0));
        if (!entries) {
            throw std::invalid_argument{"count expects a table"};
        }
        i64 n = static_cast<i64>(entries.get().size());
        return step<value_list>{value_list{value{n}}, std::move(s)};
    });
    vs = run_ok(S, "return count({1, 2, 3, x = 4})");
    BOOST_TEST(vs.at(0).as_int() == 4);

    auto bad = run(std::move(S), "return count(7)");
    BOOST_REQUIRE(!bad.ok());
    BOOST_TEST(bad.error().as<runtime_error>().message == "count expects a table");
}

BOOST_AUTO_TEST_CASE( multiple_results_test ) {
    auto S = init();
    expose_as(S, "pair", [](vm_state&& s, value_list) {
        return step<value_list>{value_list{value{"left"}, value{true}}, std::move(s)};
    });
    expose_as(S, "nothing", [](vm_state&& s, value_list) {
        return no_values(std::move(s));
    });
    auto vs = run_ok(S, "local a, b = pair(); return b, a, select('#', nothing())");
    BOOST_TEST(vs.at(0).as_bool() == true);
    BOOST_TEST(vs.at(1).as_string() == "left");
    BOOST_TEST(vs.at(2).as_int() == 0);
}

BOOST_AUTO_TEST_CASE( call_by_name_test ) {
    auto r = call_by_name(init(), {"math", "max"},
            {value{i64{1}}, value{i64{20}}, value{i64{3}}});
    BOOST_REQUIRE(r.ok());
    BOOST_TEST(r.get().out.at(0).as_int() == 20);

    auto S = init();
    auto vs = call_ok(S, {"string", "rep"}, {value{"ab"}, value{i64{3}}});
    BOOST_TEST(vs.at(0).as_string() == "ababab");

    run_ok(S, "plain = {}\ncallable = setmetatable({}, {__call = function(_, x) return x + 1 end})");

    auto missing = call_by_name(std::move(S), {"no", "such", "fn"}, {});
    BOOST_REQUIRE(!missing.ok());
    BOOST_TEST(missing.error().kind() == ek_undefined_path);

    auto not_callable = call_by_name(std::move(S), {"plain"}, {});
    BOOST_REQUIRE(!not_callable.ok());
    BOOST_TEST(not_callable.error().kind() == ek_undefined_path);
    BOOST_TEST((not_callable.error().as<undefined_path>().keys == key_path{"plain"}));

    vs = call_ok(S, {"callable"}, {value{i64{41}}});
    BOOST_TEST(vs.at(0).as_int() == 42);
}

BOOST_AUTO_TEST_CASE( call_ref_test ) {
    auto S = init();
    auto upper = ref_get(S, {"string", "upper"});
    BOOST_REQUIRE(upper.ok());
    auto r = call(std::move(S), upper.get(), {value{"abc"}});
    BOOST_REQUIRE(r.ok());
    S = std::move(r.get().state);
    BOOST_TEST(r.get().out.at(0).as_string() == "ABC");

    // a host closure is called the same way
    auto e = expose(std::move(S), [](vm_state&& s, value_list args) {
        return step<value_list>{value_list{value{args.at(0).as_int() * 2}}, std::move(s)};
    });
    S = std::move(e.state);
    auto twice = decode(e.out, decode_ref);
    BOOST_REQUIRE(twice.ok());
    auto t = call(std::move(S), twice.get(), {value{i64{21}}});
    BOOST_REQUIRE(t.ok());
    S = std::move(t.get().state);
    BOOST_TEST(t.get().out.at(0).as_int() == 42);

    // a table is not callable
    run_ok(S, "tbl = {}");
    auto tbl = ref_get(S, {"tbl"});
    auto bad = call(std::move(S), tbl.get(), {});
    BOOST_REQUIRE(!bad.ok());
    BOOST_TEST(bad.error().kind() == ek_runtime);
    BOOST_TEST(S.valid());
}

BOOST_AUTO_TEST_CASE( host_exception_test ) {
    auto S = init();
    expose_as(S, "thrower", [](vm_state&&, value_list) -> step<value_list> {
        throw std::runtime_error{"nope"};
    });

    auto r = call_by_name(std::move(S), {"thrower"}, {});
    BOOST_REQUIRE(!r.ok());
    BOOST_TEST(r.error().kind() == ek_runtime);
    BOOST_TEST(r.error().as<glua::runtime_error>().message == "nope");

    // the guest can catch it like any other error
    auto vs = run_ok(S, "local ok, msg = pcall(thrower); return ok, msg");
    BOOST_TEST(vs.at(0).as_bool() == false);
    BOOST_TEST(vs.at(1).as_string() == "nope");
}

BOOST_AUTO_TEST_CASE( reentrant_call_test ) {
    auto S = init();
    // apply(f, x) calls back into the guest
    expose_as(S, "apply", [](vm_state&& s, value_list args) {
        auto f = decode(args.at(0), decode_ref).take();
        auto r = call(std::move(s), f, {args.at(1)});
        if (!r) {
            throw std::runtime_error{r.error().describe()};
        }
        return r.take();
    });
    auto vs = run_ok(S, "return apply(function(x) return x * 3 end, 7)");
    BOOST_TEST(vs.at(0).as_int() == 21);

    // recursion through both sides of the bridge
    expose_as(S, "fact", [](vm_state&& s, value_list args) {
        i64 n = args.at(0).as_int();
        if (n <= 1) {
            return step<value_list>{value_list{value{i64{1}}}, std::move(s)};
        }
        auto r = call_by_name(std::move(s), {"lua_fact"}, {value{n - 1}});
        if (!r) {
            throw std::runtime_error{r.error().describe()};
        }
        auto st = r.take();
        return step<value_list>{value_list{value{n * st.out.at(0).as_int()}},
            std::move(st.state)};
    });
    run_ok(S, "function lua_fact(n) if n <= 1 then return 1 end return n * fact(n - 1) end");

    auto gen = S.generation();
    vs = call_ok(S, {"fact"}, {value{i64{5}}});
    BOOST_TEST(vs.at(0).as_int() == 120);
    BOOST_TEST(S.generation() > gen);

    // an error deep in the recursion surfaces in the outermost call
    run_ok(S, "function lua_fact(n) error('stop at ' .. n, 0) end");
    auto r = call_by_name(std::move(S), {"fact"}, {value{i64{4}}});
    BOOST_REQUIRE(!r.ok());
    BOOST_TEST(r.error().as<runtime_error>().message.find("stop at 3") != string::npos);
    BOOST_TEST(run_ok(S, "return 1").at(0).as_int() == 1);
}

BOOST_AUTO_TEST_CASE( closure_mutates_state_test ) {
    auto S = init();
    expose_as(S, "remember", [](vm_state&& s, value_list args) {
        auto r = set(std::move(s), {"memo", "last"}, args.at(0));
        if (!r) {
            throw std::runtime_error{r.error().describe()};
        }
        return no_values(r.take());
    });
    run_ok(S, "remember('first'); remember('second')");
    BOOST_TEST(get(S, {"memo", "last"}).get().as_string() == "second");
}

BOOST_AUTO_TEST_CASE( closure_state_discipline_test ) {
    auto S = init();
    auto other = init();
    vm_state stash;

    expose_as(S, "foreign", [&other](vm_state&&, value_list) {
        return no_values(std::move(other));
    });
    expose_as(S, "drop", [](vm_state&&, value_list) {
        return no_values(vm_state{});
    });
    expose_as(S, "smuggle", [&stash](vm_state&& s, value_list) {
        stash = std::move(s);
        return no_values(vm_state{});
    });

    auto foreign = call_by_name(std::move(S), {"foreign"}, {});
    BOOST_REQUIRE(!foreign.ok());
    BOOST_TEST(foreign.error().kind() == ek_runtime);
    BOOST_TEST(foreign.error().as<runtime_error>().message.find("lineage")
            != string::npos);

    auto drop = call_by_name(std::move(S), {"drop"}, {});
    BOOST_TEST(drop.error().kind() == ek_runtime);

    auto smuggle = call_by_name(std::move(S), {"smuggle"}, {});
    BOOST_TEST(smuggle.error().kind() == ek_runtime);
    // the handle kept by the closure is outdated once the call returns
    BOOST_REQUIRE(stash.valid());
    BOOST_TEST(get(stash, {"print"}).error().kind() == ek_stale_state);
    stash = vm_state{};

    // the caller's handle survived all three failures
    BOOST_TEST(run_ok(S, "return 'still here'").at(0).as_string() == "still here");
}

BOOST_AUTO_TEST_CASE( lineage_test ) {
    auto S1 = init();
    auto S2 = init();
    BOOST_TEST(S1.lineage() != S2.lineage());

    auto t = run_ok(S1, "function f() return 1 end; return {}");
    auto f = ref_get(S1, {"f"});
    BOOST_REQUIRE(f.ok());

    auto r = set(std::move(S2), {"t"}, t.at(0));
    BOOST_REQUIRE(!r.ok());
    BOOST_TEST(r.error().kind() == ek_stale_state);

    auto c = call(std::move(S2), f.get(), {});
    BOOST_REQUIRE(!c.ok());
    BOOST_TEST(c.error().kind() == ek_stale_state);

    auto a = call(std::move(S2), ref_get(S2, {"print"}).get(), {t.at(0)});
    BOOST_TEST(a.error().kind() == ek_stale_state);
    BOOST_TEST(S2.valid());
}

BOOST_AUTO_TEST_CASE( discarded_lineage_test ) {
    value t;
    {
        auto S = init();
        t = run_ok(S, "return {1, 2}").at(0);
        BOOST_TEST(decode(t, decode_ref).get().alive());
    }
    BOOST_TEST(!decode(t, decode_ref).get().alive());
    auto entries = table_entries(t);
    BOOST_REQUIRE(!entries.ok());
    BOOST_TEST(entries.error().kind() == ek_stale_state);

    auto S = init();
    BOOST_TEST(set(std::move(S), {"t"}, t).error().kind() == ek_stale_state);
}

BOOST_AUTO_TEST_CASE( expose_stale_test ) {
    host_function fn = [](vm_state&& s, value_list) {
        return no_values(std::move(s));
    };
    BOOST_CHECK_THROW(expose(vm_state{}, fn), std::logic_error);

    auto S = init();
    auto moved = std::move(S);
    BOOST_CHECK_THROW(expose(std::move(S), fn), std::logic_error);
    BOOST_CHECK_NO_THROW(expose(std::move(moved), fn));
}

BOOST_AUTO_TEST_CASE( closure_collected_test ) {
    auto token = std::make_shared<int>(0);
    auto S = init();
    {
        expose_as(S, "tracked", [token](vm_state&& s, value_list) {
            return no_values(std::move(s));
        });
    }
    BOOST_TEST(token.use_count() == 2);
    run_ok(S, "tracked = nil; collectgarbage(); collectgarbage()");
    BOOST_TEST(token.use_count() == 1);
}

BOOST_AUTO_TEST_CASE( coroutine_call_test ) {
    auto S = init();
    expose_as(S, "negate", [](vm_state&& s, value_list args) {
        return step<value_list>{value_list{value{-args.at(0).as_int()}}, std::move(s)};
    });
    auto vs = run_ok(S, "return coroutine.wrap(function(n) return negate(n) end)(5)");
    BOOST_TEST(vs.at(0).as_int() == -5);

    // arguments come from the coroutine's own stack
    expose_as(S, "count", [](vm_state&& s, value_list args) {
        auto entries = table_entries(args.at(0));
        if (!entries) {
            throw std::invalid_argument{"count expects a table"};
        }
        i64 n = static_cast<i64>(entries.get().size()) + args.at(1).as_int();
        return step<value_list>{value_list{value{n}}, std::move(s)};
    });
    vs = run_ok(S,
            "local co = coroutine.create(function(t, k)\n"
            "    coroutine.yield(count(t, k))\n"
            "    return count({}, k)\n"
            "end)\n"
            "local ok1, a = coroutine.resume(co, {1, 2, x = 3}, 10)\n"
            "local ok2, b = coroutine.resume(co)\n"
            "return ok1, a, ok2, b");
    BOOST_REQUIRE(vs.size() == 4);
    BOOST_TEST(vs[0].as_bool());
    BOOST_TEST(vs[1].as_int() == 13);
    BOOST_TEST(vs[2].as_bool());
    BOOST_TEST(vs[3].as_int() == 10);

    // a table read on a coroutine outlives it
    auto kept = std::make_shared<value>();
    expose_as(S, "keep", [kept](vm_state&& s, value_list args) {
        *kept = args.at(0);
        return no_values(std::move(s));
    });
    run_ok(S, "coroutine.wrap(function() keep({7, 8}) end)()");
    run_ok(S, "collectgarbage()");
    auto entries = table_entries(*kept);
    BOOST_REQUIRE(entries.ok());
    BOOST_TEST(entries.get().size() == 2);
}

BOOST_AUTO_TEST_CASE( finalizer_call_test ) {
    auto calls = std::make_shared<int>(0);
    {
        auto S = init();
        expose_as(S, "notify", [calls](vm_state&& s, value_list) {
            ++*calls;
            return no_values(std::move(s));
        });
        run_ok(S, "setmetatable({}, {__gc = function() notify() end})");
        run_ok(S, "collectgarbage(); collectgarbage()");
        BOOST_TEST(*calls == 1);

        // finalized when the state is closed, after the last handle is gone
        run_ok(S, "keep = setmetatable({}, {__gc = function() notify() end})");
    }
    BOOST_TEST(*calls == 1);
}
