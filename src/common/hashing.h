#pragma once

#include <array>
#include <cstddef>
#include <functional>

// Combines the std::hash of every element, for use as unordered_map keys

template <class Object>
struct hash_multiple_helper {
	constexpr std::size_t operator()(Object const & obj) const noexcept {
		return std::hash<Object>()(obj);
	}
};

template <class T, std::size_t N>
struct hash_multiple_helper<std::array<T, N>> {
	constexpr std::size_t operator()(std::array<T, N> const & elements
	) const noexcept {
		std::size_t h = 0;
		for (T const & element : elements) {
			h ^= (h << 6) + (h >> 2) + 5431zu
				+ hash_multiple_helper<T>()(element);
		}
		return h;
	}
};

template <class Object>
constexpr std::size_t hash_multiple(Object const & object) noexcept {
	return hash_multiple_helper<Object>()(object);
}

template <class FirstObject, class... Rest>
constexpr std::size_t hash_multiple(
	FirstObject const & firstObject, Rest const &... rest
) noexcept {
	std::size_t h = hash_multiple_helper<FirstObject>()(firstObject);
	h ^= (h << 6) + (h >> 2) + 5431zu + hash_multiple<Rest...>(rest...);
	return h;
}

// For std::unordered_map<std::array<...>, ...>
struct array_hash final {
	template <class T, std::size_t N>
	std::size_t operator()(std::array<T, N> const & elements) const noexcept {
		return hash_multiple(elements);
	}
};
