#pragma once

namespace famgraph::db::sql {

/*
  Canonical SQL for the snapshot tables.

  `position` keeps the FamilyGraph iteration order so a reload yields the
  same listing order as before the restart.
*/

static constexpr const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS person ("
    " id TEXT PRIMARY KEY,"
    " position INTEGER NOT NULL,"
    " first_name TEXT NOT NULL,"
    " last_name TEXT NOT NULL DEFAULT '',"
    " nickname TEXT, birth_date TEXT, death_date TEXT,"
    " place_of_birth TEXT, place_of_death TEXT, gender TEXT, notes TEXT);",

    "CREATE TABLE IF NOT EXISTS person_attribute ("
    " person_id TEXT NOT NULL REFERENCES person(id) ON DELETE CASCADE,"
    " key TEXT NOT NULL,"
    " value TEXT NOT NULL,"
    " PRIMARY KEY (person_id, key));",

    "CREATE TABLE IF NOT EXISTS relationship ("
    " id TEXT PRIMARY KEY,"
    " position INTEGER NOT NULL,"
    " person1_id TEXT NOT NULL REFERENCES person(id) ON DELETE CASCADE,"
    " person2_id TEXT NOT NULL REFERENCES person(id) ON DELETE CASCADE,"
    " type TEXT NOT NULL,"
    " start_date TEXT, end_date TEXT, location TEXT, notes TEXT,"
    " UNIQUE (person1_id, person2_id, type),"
    " CHECK (person1_id <> person2_id));",

    "CREATE TABLE IF NOT EXISTS relationship_attribute ("
    " relationship_id TEXT NOT NULL REFERENCES relationship(id) ON DELETE CASCADE,"
    " key TEXT NOT NULL,"
    " value TEXT NOT NULL,"
    " PRIMARY KEY (relationship_id, key));",

    "CREATE INDEX IF NOT EXISTS relationship_person1 ON relationship(person1_id);",
    "CREATE INDEX IF NOT EXISTS relationship_person2 ON relationship(person2_id);",
};

// children first, so the cascade has nothing left to do
static constexpr const char* CLEAR_SNAPSHOT =
    "DELETE FROM relationship_attribute;"
    " DELETE FROM relationship;"
    " DELETE FROM person_attribute;"
    " DELETE FROM person;";

static constexpr const char* INSERT_PERSON =
    "INSERT INTO person(id,position,first_name,last_name,nickname,birth_date,death_date,"
    "place_of_birth,place_of_death,gender,notes)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_PERSON_ATTRIBUTE =
    "INSERT INTO person_attribute(person_id,key,value) VALUES(?,?,?);";

static constexpr const char* INSERT_RELATIONSHIP =
    "INSERT INTO relationship(id,position,person1_id,person2_id,type,start_date,end_date,location,notes)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* INSERT_RELATIONSHIP_ATTRIBUTE =
    "INSERT INTO relationship_attribute(relationship_id,key,value) VALUES(?,?,?);";

static constexpr const char* SELECT_PEOPLE =
    "SELECT id,first_name,last_name,nickname,birth_date,death_date,"
    "place_of_birth,place_of_death,gender,notes"
    " FROM person ORDER BY position;";

static constexpr const char* SELECT_PERSON_ATTRIBUTES =
    "SELECT person_id,key,value FROM person_attribute;";

static constexpr const char* SELECT_RELATIONSHIPS =
    "SELECT id,person1_id,person2_id,type,start_date,end_date,location,notes"
    " FROM relationship ORDER BY position;";

static constexpr const char* SELECT_RELATIONSHIP_ATTRIBUTES =
    "SELECT relationship_id,key,value FROM relationship_attribute;";

} // namespace famgraph::db::sql
