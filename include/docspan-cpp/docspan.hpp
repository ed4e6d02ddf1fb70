/// @file docspan.hpp
/// @brief Umbrella header for the docspan-cpp library.
///
/// Include this single header for access to all public types:
/// Session, SessionRegistry, Document, SpanEditor, History,
/// ConcurrencyController, DocumentEngine, PatchExtractor, and Error.

#pragma once

#include <docspan-cpp/address_index.hpp>
#include <docspan-cpp/concurrency.hpp>
#include <docspan-cpp/document.hpp>
#include <docspan-cpp/engine.hpp>
#include <docspan-cpp/error.hpp>
#include <docspan-cpp/history.hpp>
#include <docspan-cpp/json.hpp>
#include <docspan-cpp/options.hpp>
#include <docspan-cpp/patch.hpp>
#include <docspan-cpp/registry.hpp>
#include <docspan-cpp/session.hpp>
#include <docspan-cpp/span_editor.hpp>
#include <docspan-cpp/style.hpp>
#include <docspan-cpp/types.hpp>
