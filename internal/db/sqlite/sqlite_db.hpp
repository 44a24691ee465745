#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace market::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; Mutex() serializes
  transactions on it (see SqliteTransaction).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Pragmas, migrations and transaction control.
  void Exec(const std::string& sql);

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace market::db::sqlite
