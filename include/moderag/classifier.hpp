#pragma once

#include "moderag/models.hpp"

namespace moderag {

// Anything that turns a request into a result: the in-process orchestrator
// or a client of a remote server. Failures throw ModerationError, as a
// ClassificationError when the failing stage is known.
class Classifier {
public:
    virtual ~Classifier() = default;
    virtual ClassificationResult classify(const ClassificationRequest& request) = 0;
};

} // namespace moderag
