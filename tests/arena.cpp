// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/arena.hpp>
#include <iostream>
#include <string>
#include <vector>

#undef NDEBUG
#include <cassert>

namespace {

std::vector<int> destroyed;

struct node
{
	int id;
	explicit node(int i) : id{i} {}
	node(node const&) = delete;
	node& operator=(node const&) = delete;
	~node() { destroyed.push_back(id); }
};

struct point
{
	int x;
	int y;
};

} // namespace

void test_make()
{
	plait::arena a;
	int* const i = a.make<int>(42);
	point* const p = a.make<point>(3, 4);
	assert(*i == 42);
	assert(p->x == 3 && p->y == 4);
	assert(a.object_count() == 2);
}

void test_teardown_order()
{
	destroyed.clear();
	{
		plait::arena a{256};
		(void)a.make<node>(1);
		(void)a.make<node>(2);
		(void)a.make<node>(3);
		assert(destroyed.empty());
	}
	assert((destroyed == std::vector<int>{3, 2, 1}));
}

void test_vectors()
{
	plait::arena a;
	auto v = a.make_vector<std::string>();
	assert(v.get_allocator().resource() == a.resource());
	v.emplace_back("alpha");
	v.emplace_back("beta");
	auto moved = std::move(v);
	assert(moved.get_allocator().resource() == a.resource());
	assert(moved.size() == 2);
	assert(moved[1] == "beta");

	auto* boxed = a.make<plait::arena_vector<int>>(a.make_vector<int>());
	boxed->push_back(7);
	assert(boxed->get_allocator().resource() == a.resource());
}

void test_copy_string()
{
	plait::arena a;
	std::string source{"transient"};
	std::string_view const kept = a.copy_string(source);
	source.assign("overwritten");
	assert(kept == "transient");
	assert(a.copy_string("").empty());
}

int main()
try {
	test_make();
	test_teardown_order();
	test_vectors();
	test_copy_string();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
}
