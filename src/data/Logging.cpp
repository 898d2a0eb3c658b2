#include "todotxt/data/Logging.hpp"

Q_LOGGING_CATEGORY(lcTodoTxtData, "todotxt.data")
