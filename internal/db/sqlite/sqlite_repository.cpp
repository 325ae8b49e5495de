#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/sql/sql_queries.hpp"

namespace famgraph::db::sqlite {

using famgraph::db::ErrorCode;
using famgraph::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Write
// ------------------------------------------------------------------

namespace {

// Runs one bound INSERT and resets it for the next row.
int StepOnce(sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
    return rc;
}

} // namespace

Result SqliteRepository::ReplaceSnapshot(Transaction& t, const model::GraphSnapshot& snapshot) {
    auto& tx = TX(t);
    auto* db = tx.DB().Handle();

    int rc = sqlite3_exec(db, sql::CLEAR_SNAPSHOT, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return Translate(db, rc);

    try {
        auto person      = tx.DB().Prepare(sql::INSERT_PERSON);
        auto person_attr = tx.DB().Prepare(sql::INSERT_PERSON_ATTRIBUTE);
        auto rel         = tx.DB().Prepare(sql::INSERT_RELATIONSHIP);
        auto rel_attr    = tx.DB().Prepare(sql::INSERT_RELATIONSHIP_ATTRIBUTE);

        int64_t position = 0;
        for (const auto& p : snapshot.people) {
            auto* st = person.get();
            BindText(st, 1, p.id);
            BindI64(st, 2, position++);
            BindText(st, 3, p.first_name);
            BindText(st, 4, p.last_name);
            BindOptText(st, 5, p.nickname);
            BindOptText(st, 6, p.birth_date);
            BindOptText(st, 7, p.death_date);
            BindOptText(st, 8, p.place_of_birth);
            BindOptText(st, 9, p.place_of_death);
            if (p.gender) {
                BindText(st, 10, std::string(model::ToString(*p.gender)));
            } else {
                sqlite3_bind_null(st, 10);
            }
            BindOptText(st, 11, p.notes);
            if ((rc = StepOnce(st)) != SQLITE_DONE) return Translate(db, rc);

            for (const auto& [key, value] : p.attributes) {
                BindText(person_attr.get(), 1, p.id);
                BindText(person_attr.get(), 2, key);
                BindText(person_attr.get(), 3, value);
                if ((rc = StepOnce(person_attr.get())) != SQLITE_DONE) return Translate(db, rc);
            }
        }

        position = 0;
        for (const auto& r : snapshot.relationships) {
            auto* st = rel.get();
            BindText(st, 1, r.id);
            BindI64(st, 2, position++);
            BindText(st, 3, r.person1_id);
            BindText(st, 4, r.person2_id);
            BindText(st, 5, std::string(model::ToString(r.type)));
            BindOptText(st, 6, r.start_date);
            BindOptText(st, 7, r.end_date);
            BindOptText(st, 8, r.location);
            BindOptText(st, 9, r.notes);
            if ((rc = StepOnce(st)) != SQLITE_DONE) return Translate(db, rc);

            for (const auto& [key, value] : r.attributes) {
                BindText(rel_attr.get(), 1, r.id);
                BindText(rel_attr.get(), 2, key);
                BindText(rel_attr.get(), 3, value);
                if ((rc = StepOnce(rel_attr.get())) != SQLITE_DONE) return Translate(db, rc);
            }
        }
    } catch (const std::runtime_error& ex) {
        return Result::Err(ErrorCode::InternalError, ex.what());
    }

    return Result::Ok();
}

// ------------------------------------------------------------------
// Read
// ------------------------------------------------------------------

Result SqliteRepository::LoadSnapshot(Transaction& t, model::GraphSnapshot& out) {
    auto& tx = TX(t);
    auto* db = tx.DB().Handle();

    model::GraphSnapshot snapshot;
    int rc = SQLITE_OK;

    try {
        std::unordered_map<std::string, std::size_t> person_at;
        auto people = tx.DB().Prepare(sql::SELECT_PEOPLE);
        while ((rc = sqlite3_step(people.get())) == SQLITE_ROW) {
            auto* st = people.get();
            model::Person p;
            p.id             = ColText(st, 0);
            p.first_name     = ColText(st, 1);
            p.last_name      = ColText(st, 2);
            p.nickname       = ColOptText(st, 3);
            p.birth_date     = ColOptText(st, 4);
            p.death_date     = ColOptText(st, 5);
            p.place_of_birth = ColOptText(st, 6);
            p.place_of_death = ColOptText(st, 7);
            if (auto gender = ColOptText(st, 8)) {
                auto parsed = model::ParseGender(*gender);
                if (!parsed) return Result::Err(ErrorCode::Corruption, "unknown gender in person " + p.id + ": " + *gender);
                p.gender = *parsed;
            }
            p.notes = ColOptText(st, 9);
            person_at[p.id] = snapshot.people.size();
            snapshot.people.push_back(std::move(p));
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);

        auto person_attrs = tx.DB().Prepare(sql::SELECT_PERSON_ATTRIBUTES);
        while ((rc = sqlite3_step(person_attrs.get())) == SQLITE_ROW) {
            auto it = person_at.find(ColText(person_attrs.get(), 0));
            if (it == person_at.end()) continue;
            snapshot.people[it->second].attributes[ColText(person_attrs.get(), 1)] = ColText(person_attrs.get(), 2);
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);

        std::unordered_map<std::string, std::size_t> rel_at;
        auto rels = tx.DB().Prepare(sql::SELECT_RELATIONSHIPS);
        while ((rc = sqlite3_step(rels.get())) == SQLITE_ROW) {
            auto* st = rels.get();
            model::Relationship r;
            r.id         = ColText(st, 0);
            r.person1_id = ColText(st, 1);
            r.person2_id = ColText(st, 2);
            auto type    = model::ParseRelationshipType(ColText(st, 3));
            if (!type) return Result::Err(ErrorCode::Corruption, "unknown relationship type in " + r.id + ": " + ColText(st, 3));
            r.type       = *type;
            r.start_date = ColOptText(st, 4);
            r.end_date   = ColOptText(st, 5);
            r.location   = ColOptText(st, 6);
            r.notes      = ColOptText(st, 7);
            rel_at[r.id] = snapshot.relationships.size();
            snapshot.relationships.push_back(std::move(r));
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);

        auto rel_attrs = tx.DB().Prepare(sql::SELECT_RELATIONSHIP_ATTRIBUTES);
        while ((rc = sqlite3_step(rel_attrs.get())) == SQLITE_ROW) {
            auto it = rel_at.find(ColText(rel_attrs.get(), 0));
            if (it == rel_at.end()) continue;
            snapshot.relationships[it->second].attributes[ColText(rel_attrs.get(), 1)] = ColText(rel_attrs.get(), 2);
        }
        if (rc != SQLITE_DONE) return Translate(db, rc);
    } catch (const std::runtime_error& ex) {
        return Result::Err(ErrorCode::InternalError, ex.what());
    }

    out = std::move(snapshot);
    return Result::Ok();
}

} // namespace famgraph::db::sqlite
