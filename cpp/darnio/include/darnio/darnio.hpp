#pragma once

#include "codec.hpp"
#include "errors.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "visibility.hpp"
