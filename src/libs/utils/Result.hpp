// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QString>
#include <QStringList>

#include <utility>

namespace Utils {

// Outcome of an operation that can be rejected synchronously. Carries every
// reason it was rejected, not just the first one.
struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.addError(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	// Folds another outcome into this one.
	Result& merge(const Result& other)
	{
		if (!other.ok)
			ok = false;
		errors.append(other.errors);
		return *this;
	}

	QString message(const QString& separator = QStringLiteral("; ")) const
	{
		return errors.join(separator);
	}

	explicit operator bool() const { return ok; }
};

} // namespace Utils
