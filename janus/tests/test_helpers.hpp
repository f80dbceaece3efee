#pragma once

#include "manifest.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

/// Unique socket path under /tmp for one test.
std::string unique_socket_path(const std::string& tag);

/// Polls `predicate` until it holds or `timeout` elapses.
bool wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

/// Manifest used across the validator, dispatcher and client tests:
/// createWorkspace, addMember (Person model), tagItems (array of strings),
/// setLevel (integer with range and enum), renameTag (pattern without a
/// length bound), listUsers (response spec).
nlohmann::json sample_manifest_document();
std::shared_ptr<const janus::Manifest> sample_manifest();
