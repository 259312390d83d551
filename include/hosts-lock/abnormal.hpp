#pragma once

#include <abnormal/deviant.hpp>
#include <abnormal/permission.hpp>
#include <abnormal/format.hpp>
#include <abnormal/domain.hpp>
#include <abnormal/hosts.hpp>
#include <abnormal/configuration.hpp>
