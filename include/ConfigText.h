#pragma once

#include <string>

#include "CheckpointConfig.h"

namespace ckpt {

// Line-oriented "section.key = value" text. '#' starts a comment; lists are
// comma separated. Keys absent from the text keep the value already in *cfg,
// so callers normally start from a default RunConfig.
//
// Returns false on the first unknown key, malformed value or failed
// validation; *cfg may be partially updated in that case.
bool parseConfigText(const std::string& text, RunConfig* cfg, ConfigError* err);

// Reads a file and forwards to parseConfigText. A missing file is a ConfigError.
bool loadConfigFile(const std::string& path, RunConfig* cfg, ConfigError* err);

// Deterministic export in the same format (loads back to an identical config).
// Writes at most cap bytes (NUL-terminated when cap > 0) and returns the number
// of characters written.
int exportConfigText(const RunConfig& cfg, char* buf, int cap);

std::string configToText(const RunConfig& cfg);

} // namespace ckpt
