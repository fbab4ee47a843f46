#include "sync/model/Policy.hpp"

#include <stdexcept>

using namespace ms::sync::model;

void Policy::validate() const {
    if (remove && !force)
        throw std::invalid_argument("--remove requires --force, deleting target objects needs explicit consent");
}
