#pragma once

#include <stdexcept>
#include <string>

namespace tokentally {

// Failure to enumerate the storage root. Unreadable entries below the root
// are skipped and never reported through this type.
class ScanError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        Io
    };

    ScanError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

// Per-file parse failure. Carried by value inside ParseOutcome; the parser
// never throws it.
struct ParseError {
    enum class Kind {
        Json,
        Io
    };

    Kind kind = Kind::Json;
    std::string message;
};

class ReaderError : public std::runtime_error {
public:
    enum class Kind {
        Scan,
        NoData
    };

    ReaderError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    static ReaderError fromScan(const ScanError &error)
    {
        ReaderError wrapped(Kind::Scan, std::string("scan failed: ") + error.what());
        wrapped.m_scanKind = error.kind();
        return wrapped;
    }

    Kind kind() const { return m_kind; }

    // Only meaningful when kind() == Kind::Scan.
    ScanError::Kind scanKind() const { return m_scanKind; }

private:
    Kind m_kind;
    ScanError::Kind m_scanKind = ScanError::Kind::Io;
};

class DatabaseError : public std::runtime_error {
public:
    enum class Kind {
        Io,
        Migration,
        Connection,
        Query
    };

    DatabaseError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

class CollectorError : public std::runtime_error {
public:
    enum class Kind {
        Database,
        Lock
    };

    CollectorError(Kind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    static CollectorError fromDatabase(const DatabaseError &error)
    {
        CollectorError wrapped(Kind::Database,
                               std::string("database error: ") + error.what());
        wrapped.m_databaseKind = error.kind();
        return wrapped;
    }

    Kind kind() const { return m_kind; }

    // Only meaningful when kind() == Kind::Database.
    DatabaseError::Kind databaseKind() const { return m_databaseKind; }

private:
    Kind m_kind;
    DatabaseError::Kind m_databaseKind = DatabaseError::Kind::Query;
};

} // namespace tokentally
