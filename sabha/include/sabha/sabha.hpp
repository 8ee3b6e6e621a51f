#pragma once
// Sabha: a council of agents with a memory
//
// - Types: signals, events, memory records
// - Memory: durable vector store with metadata and filters
// - Embedder: text to vector, hash fallback when the encoder is away
// - Routers: output (fan-out + admission), input (recall + ranking)
// - Coordinator: tick state machine, consensus, risk gates, learning
// - Council: everything wired from one configuration

#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "memory_store.hpp"
#include "embedder.hpp"
#ifdef SABHA_WITH_ONNX
#include "onnx_backend.hpp"
#endif
#include "output_router.hpp"
#include "input_router.hpp"
#include "coordinator.hpp"
#include "agents.hpp"
#include "config.hpp"
#include "council.hpp"
#include "version.hpp"
