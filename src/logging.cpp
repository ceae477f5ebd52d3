#include "uvm/logging.hpp"

Q_LOGGING_CATEGORY(lcUvmEngine, "uvm.engine")
Q_LOGGING_CATEGORY(lcUvmStore, "uvm.store")
Q_LOGGING_CATEGORY(lcUvmCli, "uvm.cli")
