#pragma once

#include "TransformValues.h"

#include <string>
#include <string_view>

namespace Scrim::TransformCodec {

// Tolerant: unrecognized or missing sub-expressions keep their defaults.
// Recognizes translate(X, Y), scale(X[, Y]) and rotate(Ddeg).
TransformValues parse(std::string_view transform);

// "translate(Xpx, Ypx) scale(Sx, Sy) rotate(Ddeg)"; parse(format(v)) == v.
std::string format(const TransformValues &values);

TransformValues merge(const TransformValues &base, const TransformPatch &patch);

bool isIdentity(const TransformValues &values);

} // namespace Scrim::TransformCodec
