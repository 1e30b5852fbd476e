#ifndef SWEEP_PLAN_HPP
#define SWEEP_PLAN_HPP

#include <vector>

#include "SweepConfig.hpp"
#include "SweepTypes.hpp"

using SweepPlan = std::vector<SweepStep>;

/**
 * @brief Monta o plano ordenado de passos a partir da configuração.
 *
 * Laço externo sobre as formas de onda (sine, square, sawtooth, triangle),
 * laço interno sobre os osciladores (wavetable, regular). As listas de
 * `config` apenas selecionam quais entram; a ordem em que foram escritas não
 * importa. Determinístico e sem E/S: a mesma configuração sempre produz o
 * mesmo plano.
 *
 * @throws ConfigurationError se `config.validate()` falhar.
 */
SweepPlan buildSweepPlan(const SweepConfig& config);

/**
 * @brief Frequência instantânea de uma varredura exponencial.
 *
 *    f(t) = start * (end / start)^(t / duration)
 *
 * `elapsed` é limitado a [0, duration].
 */
double sweepFrequencyAt(const SweepParameters& parameters, double elapsed);

// Verdadeiro se `index` é o último passo da sua forma de onda no plano.
bool endsWaveformGroup(const SweepPlan& plan, size_t index);

#endif  // SWEEP_PLAN_HPP
