#ifndef FIXQ_HPP
#define FIXQ_HPP

#include "fixq/core/backend.hpp"
#include "fixq/core/enums.hpp"
#include "fixq/core/exceptions.hpp"
#include "fixq/core/format.hpp"
#include "fixq/core/overflow.hpp"
#include "fixq/core/quantizer.hpp"
#include "fixq/core/rounding.hpp"
#include "fixq/core/value.hpp"

#endif // FIXQ_HPP
