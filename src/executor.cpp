#include "executor.h"

executor::executor(const std::string &id, const connection_handle &connection) : id(id), connection(connection)
{
}

std::string executor::get_description() const
{
	return "'" + id + "' (" + connection.get_description() + ")";
}
