#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "openssl/evp.h"

class Hasher
{
public:
	using Digest = std::vector<uint8_t>;

	struct Error {
		int code;
		std::string message;
	};

public:
	// Can be moved, but can't be copied
	Hasher(const Hasher&) = delete;
	Hasher& operator=(const Hasher&) = delete;
	Hasher(Hasher&&) noexcept;
	Hasher& operator=(Hasher&&) noexcept;

public:
	Hasher();
	~Hasher();

public:
	// Starts a new SHA-256 computation, discarding any pending state.
	std::optional<Error> Initialize() noexcept;
	std::optional<Error> Update(const char* buffer, const size_t size) noexcept;
	std::optional<Error> Update(std::string_view data) noexcept;
	std::tuple<bool, Digest, Error> Finalize() noexcept;

	static std::tuple<bool, Digest, Error> Digest256(std::string_view data) noexcept;
	static std::tuple<bool, Digest, Error> Combine(const Digest& left, const Digest& right) noexcept;

	static constexpr size_t kDigestSize = 32;

private:
	const EVP_MD* md_;
	EVP_MD_CTX *ctx_;
};
