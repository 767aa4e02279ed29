// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <molio/constants.hpp>
#include <molio/data/basis_set.hpp>
#include <molio/data/cube.hpp>
#include <molio/data/errors.hpp>
#include <molio/data/molecule_data.hpp>
#include <molio/data/orbital_set.hpp>
#include <molio/data/periodic_table.hpp>
#include <molio/io/formats.hpp>
#include <molio/io/line_iterator.hpp>
#include <molio/io/xyz.hpp>
#include <molio/utils/density_matrix.hpp>
#include <molio/utils/geometry.hpp>
#include <molio/utils/logger.hpp>
#include <molio/utils/natural_orbitals.hpp>
#include <molio/utils/string_utils.hpp>
