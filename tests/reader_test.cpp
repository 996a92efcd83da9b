#include <cassert>
#include <iostream>
#include <string>

#include "kiln/reader.hpp"

using namespace kiln;

static void test_reader_shapes(){
    auto n = kiln::read("(defmodule Foo.Bar [1 -2 3.5] {:k \"v\\n\"} #{a} #tag x nil true)");
    assert(is_list(*n));
    auto& el = elements(*n);
    assert(el.size() == 8);
    assert(name_of(el[0]) == "defmodule");
    assert(name_of(el[1]) == "Foo.Bar");
    assert(is_vector(*el[2]));
    assert(std::get<int64_t>(elements(*el[2])[1]->data) == -2);
    assert(std::holds_alternative<double>(elements(*el[2])[2]->data));
    auto v = map_get(*el[3], "k");
    assert(v && std::get<std::string>(v->data) == "v\n");
    assert(std::holds_alternative<set>(el[4]->data));
    assert(std::holds_alternative<tagged_value>(el[5]->data));
    assert(is_nil(el[6]));
    assert(std::get<bool>(el[7]->data));
}

static void test_reader_lines(){
    auto forms = read_all("; leading comment\n(a)\n\n(b\n  (c))", "lines.kiln");
    assert(forms.size() == 2);
    assert(line(forms[0]) == 2);
    assert(line(forms[1]) == 4);
    assert(line(elements(*forms[1])[1]) == 5);
}

static void test_reader_attribute_forms(){
    auto n = kiln::read("(@ :on-definition [Trace first])");
    assert(name_of(elements(*n)[0]) == "@");
    assert(is_keyword(*elements(*n)[1]));
    assert(to_string(n) == "(@ :on-definition [Trace first])");
}

static void test_reader_rejects(){
    const char* bad[] = {"(a", "(a))", "{:k}", "\"open"};
    for (const char* src : bad) {
        bool threw = false;
        try { (void)kiln::read(src); } catch (const parse_error&) { threw = true; }
        assert(threw && "malformed input must raise parse_error");
    }
}

void run_reader_tests(){
    std::cout << "[reader] tests...\n";
    test_reader_shapes();
    test_reader_lines();
    test_reader_attribute_forms();
    test_reader_rejects();
    std::cout << "[reader] tests passed\n";
}
