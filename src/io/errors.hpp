#pragma once

#include <stdexcept>
#include <string>

namespace pathkit
{
	class PathError : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};

	// Input lacks a root where one is required, or a rooted segment was combined.
	class MalformedPathError : public PathError
	{
	public:
		using PathError::PathError;
	};

	// Separator incompatible with the root kind, or paths of different roots related.
	class SeparatorConflictError : public PathError
	{
	public:
		using PathError::PathError;
	};

	class RootBoundaryError : public PathError
	{
	public:
		using PathError::PathError;
	};

	class NotFoundError : public PathError
	{
	public:
		using PathError::PathError;
	};

	class FileNotFoundError : public NotFoundError
	{
	public:
		using NotFoundError::NotFoundError;
	};

	class DirectoryNotFoundError : public NotFoundError
	{
	public:
		using NotFoundError::NotFoundError;
	};

	class AlreadyExistsError : public PathError
	{
	public:
		using PathError::PathError;
	};

	// Mutually exclusive policy flags, out-of-range arguments, digest failures.
	class InvalidConfigurationError : public PathError
	{
	public:
		using PathError::PathError;
	};

	class InvalidTargetError : public PathError
	{
	public:
		using PathError::PathError;
	};
} // namespace pathkit
