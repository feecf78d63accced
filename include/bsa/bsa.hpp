#pragma once

// BSA Archive Library
// Reads, validates and writes the flat little-endian BSA archive format
// (magic 00 01 00 00) used by Morrowind-era Bethesda games.

#include "archive.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: Reader / Writer classes
//    - Reader::open() parses an archive's directory
//    - Writer lays out and writes a new archive
//
// 2. High-level: Archive class
//    - One object per archive, opened or created exactly once
//
// Every fallible call takes an optional bsa::Error* describing the failure.
//
// Example usage:
//
//   // Reading an archive
//   bsa::Archive archive;
//   bsa::Error error;
//   if (archive.open("Morrowind.bsa", &error)) {
//     for (const auto &file : *archive.files()) {
//       std::cout << file.name << std::endl;
//     }
//     auto data = archive.extractToMemory("meshes/a/a_amulet.nif", &error);
//   }
//
//   // Creating a new archive
//   bsa::Archive created;
//   std::vector<std::filesystem::path> sources = {"textures/tx_a.dds"};
//   created.create("output.bsa", sources, &error);

namespace bsa {}
