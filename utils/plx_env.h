#ifndef PLX_ENV_H
#define PLX_ENV_H

#include "plx_string.h"

// Reads KEY=VALUE lines into the process environment.
// Blank lines and lines starting with # are skipped, existing values are overwritten.
// Returns false if the file can't be opened.
bool load_env_file(const plx_string& filepath);

// Environment lookups with fallback. Unparseable values fall back with a warning.
plx_string env_string(const plx_string& key, const plx_string& fallback);
double env_double(const plx_string& key, double fallback);
long long env_int(const plx_string& key, long long fallback);
bool env_bool(const plx_string& key, bool fallback);

#endif // PLX_ENV_H
