#pragma once
/*
 * EditorOptions
 *
 * Purpose: runtime options read from ~/.tinyedrc at startup.
 * Syntax: one command per line, optional leading ':'; '#', '"' and '//'
 *         start comment lines. Supported:
 *           set unknownkeys insert|ignore
 *           set atomicsave on|off
 * Note: bad lines are skipped; the first problem is reported through msg.
 */
#include <filesystem>
#include <optional>
#include <string>

enum class UnknownKeyPolicy { InsertCode, Ignore };

struct EditorOptions {
  UnknownKeyPolicy unknown_keys = UnknownKeyPolicy::InsertCode;
  bool atomic_save = true;
};

/* $HOME/.tinyedrc, or nothing when HOME is unset */
std::optional<std::filesystem::path> default_rc_path();

bool execute_rc_command(const std::string& line, EditorOptions& opts, std::string& msg);

/* a missing file is not an error: opts keep their defaults */
bool load_rc(const std::filesystem::path& path, EditorOptions& opts, std::string& msg);
