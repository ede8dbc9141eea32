// include/basecvt/basecvt.hpp - Umbrella header that exposes basecvt components.

#pragma once

// Umbrella header for basecvt.
// Users should generally include only this file.

#include <basecvt/converter.hpp>
#include <basecvt/core/biguint.hpp>
#include <basecvt/core/digits.hpp>
#include <basecvt/core/fraction.hpp>
#include <basecvt/core/integer.hpp>
#include <basecvt/errors.hpp>
#include <basecvt/io/format.hpp>
#include <basecvt/io/parse.hpp>
#include <basecvt/numeral.hpp>
#include <basecvt/util/debug.hpp>
#include <basecvt/validate.hpp>
#include <basecvt/version.hpp>
