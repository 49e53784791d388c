#ifndef FIXCAST_HPP
#define FIXCAST_HPP

#include "fixcast/core/bits.hpp"
#include "fixcast/core/byte_order.hpp"
#include "fixcast/core/decode.hpp"
#include "fixcast/core/descriptor.hpp"
#include "fixcast/core/encode.hpp"
#include "fixcast/core/enums.hpp"
#include "fixcast/core/errors.hpp"
#include "fixcast/core/fixed.hpp"
#include "fixcast/core/format.hpp"
#include "fixcast/core/rounding.hpp"

#endif // FIXCAST_HPP
