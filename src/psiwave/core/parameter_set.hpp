#pragma once

// ============================================================================
// Parameters — named scalar values an effect exposes to the router.
// ============================================================================

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

namespace psiwave {

// ---------------------------------------------------------------------------
// ParameterSink — Anything the router can push a resolved value into.
// ---------------------------------------------------------------------------
class ParameterSink {
public:
	virtual ~ParameterSink() = default;

	// Returns false if `name` is not a parameter of this sink.
	virtual bool set_parameter(const QString &name, double value) = 0;
};

// ---------------------------------------------------------------------------
// ParameterDescriptor — Metadata for one declared parameter.
// ---------------------------------------------------------------------------
struct ParameterDescriptor {
	QString name;				// "speed", "color_amount"
	double default_value = 0.0;
};

// ---------------------------------------------------------------------------
// ParameterSet — Ordered registry of parameters owned by one effect.
// ---------------------------------------------------------------------------
class ParameterSet {
public:
	// Declaring an existing name replaces its descriptor and resets it.
	void declare(const ParameterDescriptor &desc);
	void declare(const QString &name, double default_value);

	bool has(const QString &name) const;
	bool set(const QString &name, double value);

	// Current value; 0.0 for an unknown name.
	double value(const QString &name) const;

	// Names in declaration order.
	QStringList names() const;
	int size() const { return m_params.size(); }

private:
	struct Parameter {
		ParameterDescriptor desc;
		double value = 0.0;
	};

	QVector<Parameter> m_params;
	QHash<QString, int> m_index;
};

} // namespace psiwave
