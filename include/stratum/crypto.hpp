#pragma once

#include <stratum/crypto/hash.hpp>
#include <stratum/crypto/sparse_merkle_tree.hpp>
