#pragma once

#include <optional>
#include <utility>

#include "common.hh"

namespace wren {

/* a value that can only be reached through a Transaction,
 * which holds the lock for as long as it lives. */
template<typename T>
class Atom
{
public:
  class Transaction
  {
    friend class Atom;
    Atom* db;

    Transaction(Atom& db)
      : db(&db) {};

  public:
    Transaction(const Transaction&) = delete;
    Transaction(Transaction&& rhs) noexcept
      : db(rhs.db)
    {
      rhs.db = nullptr;
    }

    Transaction& operator=(const Transaction&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    T& operator*() const { return db->m_data; }
    T* operator->() const { return &db->m_data; }

    /* drops this transaction before destruction.
     * use this sparingly, it can result in some pretty unreasonable looking
     * code, but it is a necessary evil for certain patterns.
     */
    void drop()
    {
      if (db) {
        db->m_mutex.unlock();
        db = nullptr;
      }
    };

    ~Transaction()
    {
      if (db)
        db->m_mutex.unlock();
    };
  };

  Atom() = default;
  Atom(T in)
    : m_data(std::move(in)) {};

  Atom(const Atom&) = delete;
  Atom& operator=(const Atom&) = delete;

  /* attempts to acquire the resource w/ blocking */
  Transaction acquire()
  {
    m_mutex.lock();
    return Transaction(*this);
  }

  /* attempts to acquire the resource w/o blocking
   * returns an optional */
  std::optional<Transaction> try_acquire()
  {
    if (!m_mutex.try_lock())
      return std::nullopt;

    return std::optional<Transaction>(Transaction(*this));
  }

private:
  Mutex m_mutex;
  T m_data{};
};

};
