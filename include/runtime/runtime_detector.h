#pragma once

#include "runtime/runtime_config.h"
#include <string>
#include <vector>

namespace testbox {
namespace runtime {

// Relative paths of regular files under root, sorted. Hidden entries and
// dependency caches are not descended into.
std::vector<std::string> listProjectFiles(const std::string& root);

bool isExcludedDirectory(const std::string& name);

bool signatureMatches(const Signature& signature, const std::vector<std::string>& files,
                      std::vector<std::string>* matched = nullptr);

// First registry entry, in priority order, with a matching signature.
// Throws Exception(NO_RUNTIME_DETECTED).
const RuntimeConfig& detectRuntime(const std::string& workDir);

}
}
