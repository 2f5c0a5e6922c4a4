#pragma once

#include <array>

namespace engram::store::sqlite {

/*
  Schema, applied in order on every Initialize. Every statement is
  idempotent. Rows are partitioned by namespace; ids are unique within
  a namespace only.
*/
inline constexpr std::array<const char*, 3> kSchema = {
    R"sql(
CREATE TABLE IF NOT EXISTS notes (
  id         TEXT NOT NULL,
  namespace  TEXT NOT NULL,
  project_id TEXT NOT NULL,
  group_id   TEXT NOT NULL,
  title      TEXT,
  text       TEXT NOT NULL,
  tags       TEXT,
  source     TEXT,
  created_at TEXT,
  metadata   TEXT,
  embedding  BLOB,
  PRIMARY KEY (namespace, id)
);
CREATE INDEX IF NOT EXISTS idx_notes_project_id ON notes(namespace, project_id);
CREATE INDEX IF NOT EXISTS idx_notes_group_id ON notes(namespace, group_id);
CREATE INDEX IF NOT EXISTS idx_notes_created_at ON notes(namespace, created_at);
)sql",

    R"sql(
CREATE TABLE IF NOT EXISTS global_configs (
  id         TEXT NOT NULL,
  namespace  TEXT NOT NULL,
  project_id TEXT NOT NULL,
  key        TEXT NOT NULL,
  value      TEXT,
  updated_at TEXT,
  PRIMARY KEY (namespace, id),
  UNIQUE (namespace, project_id, key)
);
)sql",

    R"sql(
CREATE TABLE IF NOT EXISTS groups (
  id          TEXT NOT NULL,
  namespace   TEXT NOT NULL,
  project_id  TEXT NOT NULL,
  group_key   TEXT NOT NULL,
  title       TEXT NOT NULL,
  description TEXT NOT NULL DEFAULT '',
  created_at  TEXT NOT NULL,
  updated_at  TEXT NOT NULL,
  PRIMARY KEY (namespace, id),
  UNIQUE (namespace, project_id, group_key)
);
CREATE INDEX IF NOT EXISTS idx_groups_project_id ON groups(namespace, project_id);
)sql",
};

} // namespace engram::store::sqlite
