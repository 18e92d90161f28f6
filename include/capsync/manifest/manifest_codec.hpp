#pragma once

#include <string>
#include <string_view>

#include "capsync/core/errors.hpp"
#include "capsync/manifest/manifest.hpp"

namespace capsync::manifest {

constexpr u32 kManifestFormatVersion = 1;

// Pretty-printed JSON, camelCase keys, timestamps as epoch milliseconds.
capsync::core::Status manifest_encode(const UploadManifest& m, std::string* out);

// {Manifest, Corrupt} for anything that does not parse, has missing or
// ill-typed fields, or breaks a manifest invariant.
capsync::core::Status manifest_decode(std::string_view json, UploadManifest* out);

} // namespace capsync::manifest
