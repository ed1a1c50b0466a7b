#pragma once
#include <salvage/decode/combinators.hpp>
#include <salvage/decode/decoder.hpp>
#include <salvage/decode/structure.hpp>
