#include "parameter_set.hpp"

namespace psiwave {

void ParameterSet::declare(const ParameterDescriptor &desc)
{
	auto it = m_index.constFind(desc.name);
	if (it != m_index.constEnd()) {
		auto &p = m_params[it.value()];
		p.desc = desc;
		p.value = desc.default_value;
		return;
	}

	m_index.insert(desc.name, m_params.size());
	m_params.append({desc, desc.default_value});
}

void ParameterSet::declare(const QString &name, double default_value)
{
	ParameterDescriptor desc;
	desc.name = name;
	desc.default_value = default_value;
	declare(desc);
}

bool ParameterSet::has(const QString &name) const
{
	return m_index.contains(name);
}

bool ParameterSet::set(const QString &name, double value)
{
	auto it = m_index.constFind(name);
	if (it == m_index.constEnd())
		return false;
	m_params[it.value()].value = value;
	return true;
}

double ParameterSet::value(const QString &name) const
{
	auto it = m_index.constFind(name);
	if (it == m_index.constEnd())
		return 0.0;
	return m_params[it.value()].value;
}

QStringList ParameterSet::names() const
{
	QStringList result;
	result.reserve(m_params.size());
	for (const auto &p : m_params)
		result.append(p.desc.name);
	return result;
}

} // namespace psiwave
