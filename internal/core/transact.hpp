#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace forecast::core {

inline constexpr std::size_t kDefaultTransactAttempts = 5;

inline void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

/*
  Runs `fn(tx)` in a fresh transaction and commits it.

  A TransactionConflict (lost first-committer race, serialization failure)
  reruns the whole body on a new transaction, up to `attempts` times. Any
  other exception rolls back and propagates.
*/
template <typename Fn>
auto Transact(db::Repository& repo, Fn&& fn, std::size_t attempts = kDefaultTransactAttempts) -> decltype(fn(std::declval<db::Transaction&>())) {
  using R = decltype(fn(std::declval<db::Transaction&>()));

  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto tx = repo.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= attempts) {
        throw;
      }
    }
  }
}

} // namespace forecast::core
