// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_ARENA_HPP
#define PLAIT_INCLUDE_PLAIT_ARENA_HPP

#include <plait/tracer.hpp>

#include <cstddef>
#include <cstring>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace plait {

template <class T> using arena_vector = std::pmr::vector<T>;

// Bulk storage for everything a single parse produces. Nothing allocated here
// is freed individually; the whole arena goes away at once, after which every
// pointer, view and arena_vector handed out by it is dangling.
class arena
{
	struct finalizer
	{
		void* object;
		void (*destroy)(void*) noexcept;
	};

	std::pmr::monotonic_buffer_resource resource_;
	std::pmr::vector<finalizer> finalizers_{&resource_};
	plait::tracer tracer_;
	std::size_t object_count_{0};

	template <class T>
	static void destroy_object(void* p) noexcept
	{
		static_cast<T*>(p)->~T();
	}

public:
	static constexpr std::size_t default_initial_size{4096};

	arena() : arena{default_initial_size} {}
	explicit arena(std::size_t initial_size) : resource_{initial_size} {}
	arena(arena const&) = delete;
	arena(arena&&) = delete;
	arena& operator=(arena const&) = delete;
	arena& operator=(arena&&) = delete;

	~arena()
	{
		for (auto it = finalizers_.rbegin(); it != finalizers_.rend(); ++it)
			it->destroy(it->object);
	}

	[[nodiscard]] std::pmr::memory_resource* resource() noexcept { return &resource_; }
	[[nodiscard]] std::size_t object_count() const noexcept { return object_count_; }
	[[nodiscard]] plait::tracer& tracer() noexcept { return tracer_; }
	[[nodiscard]] plait::tracer const& tracer() const noexcept { return tracer_; }

	template <class T, class... Args>
	[[nodiscard]] T* make(Args&&... args)
	{
		void* const storage = resource_.allocate(sizeof(T), alignof(T));
		T* object = nullptr;
		if constexpr (std::is_aggregate_v<T>)
			object = ::new (storage) T{std::forward<Args>(args)...};
		else
			object = ::new (storage) T(std::forward<Args>(args)...);
		if constexpr (!std::is_trivially_destructible_v<T>) {
			try {
				finalizers_.push_back(finalizer{object, &arena::destroy_object<T>});
			} catch (std::bad_alloc const&) {
				object->~T();
				throw;
			}
		}
		++object_count_;
		return object;
	}

	template <class T>
	[[nodiscard]] arena_vector<T> make_vector()
	{
		return arena_vector<T>{&resource_};
	}

	[[nodiscard]] std::string_view copy_string(std::string_view s)
	{
		if (s.empty())
			return std::string_view{};
		auto* const storage = static_cast<char*>(resource_.allocate(s.size(), alignof(char)));
		std::memcpy(storage, s.data(), s.size());
		return std::string_view{storage, s.size()};
	}
};

} // namespace plait

#endif
