/*
 * Worker error types - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace agentworker {

// Base for every failure that reaches the caller of Worker::run()/drain().
class WorkerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing url/key/secret; thrown at construction, never retried.
class CredentialsError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

// Peer broke the session contract (e.g. first message is not the register ack).
class ProtocolError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

// Reconnect attempts exhausted.
class ConnectionError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

class DrainTimeoutError : public WorkerError {
public:
    using WorkerError::WorkerError;
};

// Transport-level failure; recovered by the reconnect loop.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace agentworker
